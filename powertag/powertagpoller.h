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

#ifndef POWERTAGPOLLER_H
#define POWERTAGPOLLER_H

#include <QObject>

#include "powertagmodelregistry.h"
#include "powertagregisterreader.h"

// Polls one paired device over its own gateway connection
class PowerTagPoller : public QObject
{
    Q_OBJECT
public:
    explicit PowerTagPoller(PowerTagModbusSession *session, quint8 unitId, const PowerTagModel &model, QObject *parent = nullptr);

    quint8 unitId() const;
    PowerTagModel model() const;
    bool reachable() const;
    // Called when the gateway connection is lost outside of a poll
    void markUnreachable();

    PowerTagModel::VoltageMode voltageMode() const;
    void setVoltageMode(PowerTagModel::VoltageMode voltageMode);
    // The configured mode, or the one the model supports if it cannot measure the configured one
    PowerTagModel::VoltageMode effectiveVoltageMode() const;

    int readTimeout() const;
    void setReadTimeout(int readTimeout);

    // Reads all blocks of the model family. Emits exactly one poll signal on success, pollFailed() otherwise.
    bool update();
    bool updateInProgress() const;

    bool setOutput(bool on);

signals:
    void reachableChanged(bool reachable);

    void energyPollFinished(const EnergyPollResult &result);
    void heatTagPollFinished(const HeatTagPollResult &result);
    void control2DIPollFinished(const Control2DIPollResult &result);
    void controlIOPollFinished(const ControlIOPollResult &result);
    void pollFailed();

private:
    PowerTagModbusSession *m_session = nullptr;
    quint8 m_unitId = 1;
    PowerTagModel m_model;
    PowerTagModel::VoltageMode m_voltageMode = PowerTagModel::VoltageModeLineToNeutral;
    int m_readTimeout = 500;
    bool m_reachable = false;
    bool m_updateInProgress = false;

    void setReachable(bool reachable);
};

#endif // POWERTAGPOLLER_H
