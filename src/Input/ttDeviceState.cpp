#include "pch.h"
#include "ttInternal.h"

namespace tt {

bool DeviceState::isHeld(KeyCode key) const
{
    return m_keys.count(key) != 0;
}

bool DeviceState::isHeld(int button) const
{
    return m_buttons.count(button) != 0;
}

void DeviceState::hold(KeyCode key)
{
    m_keys.insert(key);
}

void DeviceState::hold(int button)
{
    m_buttons.insert(button);
}

void DeviceState::unhold(KeyCode key)
{
    m_keys.erase(key);
}

void DeviceState::unhold(int button)
{
    m_buttons.erase(button);
}

const std::set<KeyCode>& DeviceState::heldKeys() const
{
    return m_keys;
}

const std::set<int>& DeviceState::heldButtons() const
{
    return m_buttons;
}

bool DeviceState::empty() const
{
    return m_keys.empty() && m_buttons.empty();
}

void DeviceState::setMousePos(int2 v)
{
    m_mouse_pos = v;
    m_mouse_pos_valid = true;
}

void DeviceState::moveMouse(int2 delta)
{
    if (m_mouse_pos_valid)
        m_mouse_pos += delta;
}

bool DeviceState::getMousePos(int2& dst) const
{
    if (!m_mouse_pos_valid)
        return false;
    dst = m_mouse_pos;
    return true;
}

} // namespace tt
