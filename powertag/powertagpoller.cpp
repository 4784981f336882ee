/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 *
 * Copyright 2026, Consolinno Energy GmbH
 * Contact: info@consolinno.de
 *
 * GNU Lesser General Public License Usage
 * Alternatively, this project may be redistributed and/or modified under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation; version 3. This project is distributed in the hope that
 * it will be useful, but WITHOUT ANY WARRANTY; without even the implied
 * warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this project. If not, see <https://www.gnu.org/licenses/>.
 *
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#include "powertagpoller.h"
#include "loggingcategories.h"

NYMEA_LOGGING_CATEGORY(dcPowerTagPoller, "PowerTagPoller")

PowerTagPoller::PowerTagPoller(PowerTagModbusSession *session, quint8 unitId, const PowerTagModel &model, QObject *parent) :
    QObject(parent),
    m_session(session),
    m_unitId(unitId),
    m_model(model)
{

}

quint8 PowerTagPoller::unitId() const
{
    return m_unitId;
}

PowerTagModel PowerTagPoller::model() const
{
    return m_model;
}

bool PowerTagPoller::reachable() const
{
    return m_reachable;
}

PowerTagModel::VoltageMode PowerTagPoller::voltageMode() const
{
    return m_voltageMode;
}

void PowerTagPoller::setVoltageMode(PowerTagModel::VoltageMode voltageMode)
{
    m_voltageMode = voltageMode;
}

PowerTagModel::VoltageMode PowerTagPoller::effectiveVoltageMode() const
{
    if (m_model.voltageModeSupport() == PowerTagModel::VoltageModeSupportLineToLine)
        return PowerTagModel::VoltageModeLineToLine;

    if (m_model.voltageModeSupport() == PowerTagModel::VoltageModeSupportLineToNeutral)
        return PowerTagModel::VoltageModeLineToNeutral;

    return m_voltageMode;
}

int PowerTagPoller::readTimeout() const
{
    return m_readTimeout;
}

void PowerTagPoller::setReadTimeout(int readTimeout)
{
    m_readTimeout = readTimeout;
}

void PowerTagPoller::markUnreachable()
{
    setReachable(false);
}

bool PowerTagPoller::updateInProgress() const
{
    return m_updateInProgress;
}

bool PowerTagPoller::update()
{
    if (m_updateInProgress) {
        qCDebug(dcPowerTagPoller()) << "Update of unit id" << m_unitId << "still in progress, skipping this cycle";
        return false;
    }

    if (!m_session->connected()) {
        qCDebug(dcPowerTagPoller()) << "Cannot update unit id" << m_unitId << ", the gateway is not connected";
        setReachable(false);
        emit pollFailed();
        return false;
    }

    if (!m_session->setUnitId(m_unitId)) {
        emit pollFailed();
        return false;
    }

    m_updateInProgress = true;
    PowerTagRegisterReader reader(m_session, m_readTimeout);
    bool success = false;
    switch (m_model.family()) {
    case PowerTagModel::FamilyEnergy: {
        EnergyPollResult result;
        success = reader.readEnergyRegisters(effectiveVoltageMode(), &result);
        if (success)
            emit energyPollFinished(result);

        break;
    }
    case PowerTagModel::FamilyHeatTag: {
        HeatTagPollResult result;
        success = reader.readHeatTagRegisters(&result);
        if (success)
            emit heatTagPollFinished(result);

        break;
    }
    case PowerTagModel::FamilyControl2DI: {
        Control2DIPollResult result;
        success = reader.readControl2DIRegisters(&result);
        if (success)
            emit control2DIPollFinished(result);

        break;
    }
    case PowerTagModel::FamilyControlIO: {
        ControlIOPollResult result;
        success = reader.readControlIORegisters(&result);
        if (success)
            emit controlIOPollFinished(result);

        break;
    }
    case PowerTagModel::FamilyUnknown:
        qCWarning(dcPowerTagPoller()) << "Cannot poll unit id" << m_unitId << "with unknown model" << m_model;
        break;
    }
    m_updateInProgress = false;

    if (!success) {
        qCWarning(dcPowerTagPoller()) << "Polling unit id" << m_unitId << "failed:" << reader.errorString();
        setReachable(false);
        emit pollFailed();
        return false;
    }

    setReachable(true);
    return true;
}

bool PowerTagPoller::setOutput(bool on)
{
    if (m_model.family() != PowerTagModel::FamilyControlIO) {
        qCWarning(dcPowerTagPoller()) << "Unit id" << m_unitId << "has no controllable output" << m_model;
        return false;
    }

    if (!m_session->connected() || !m_session->setUnitId(m_unitId))
        return false;

    PowerTagRegisterReader reader(m_session, m_readTimeout);
    if (!reader.writeControlIOOutput(on)) {
        qCWarning(dcPowerTagPoller()) << "Switching the output of unit id" << m_unitId << "failed:" << reader.errorString();
        return false;
    }

    qCDebug(dcPowerTagPoller()) << "Switched output of unit id" << m_unitId << (on ? "on" : "off");
    return true;
}

void PowerTagPoller::setReachable(bool reachable)
{
    if (m_reachable == reachable)
        return;

    m_reachable = reachable;
    emit reachableChanged(m_reachable);
}
