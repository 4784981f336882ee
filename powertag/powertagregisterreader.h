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

#ifndef POWERTAGREGISTERREADER_H
#define POWERTAGREGISTERREADER_H

#include <QMap>
#include <QString>
#include <QVector>

#include "powertagmodbussession.h"
#include "powertagmodelregistry.h"

struct EnergyPollResult
{
    double currentL1 = 0;       // A
    double currentL2 = 0;
    double currentL3 = 0;
    double voltagePh1 = 0;      // V, L-N or L-L depending on the voltage mode
    double voltagePh2 = 0;
    double voltagePh3 = 0;
    double powerL1 = 0;         // W
    double powerL2 = 0;
    double powerL3 = 0;
    double totalPower = 0;
    double powerFactor = 0;
    double frequency = 0;       // Hz
    double temperature = 0;     // °C
    double totalEnergy = 0;     // kWh
};

struct HeatTagPollResult
{
    double temperature = 0;     // °C
    double humidity = 0;        // %
    quint16 alarmLevel = 0;     // 0 none, 1 low, 2 medium, 3 high
};

struct Control2DIPollResult
{
    bool di1Status = false;
    bool di2Status = false;
};

struct ControlIOPollResult
{
    bool di1Status = false;
    bool outputStatus = false;
};

class PowerTagRegisterReader
{
public:
    enum Register {
        // Energy family
        RegisterCurrentL1 = 2999,
        RegisterVoltageLL1 = 3019,
        RegisterVoltageLN1 = 3027,
        RegisterPowerL1 = 3053,
        RegisterPowerFactor = 3083,
        RegisterFrequency = 3109,
        RegisterTemperature = 3131,
        RegisterEnergyTotal = 3203,
        // HeatTag
        RegisterHeatTagAlarm = 3323,
        RegisterHeatTagTemperature = 4001,
        RegisterHeatTagHumidity = 4007,
        // Control modules
        RegisterDigitalInput1Status = 34065,
        RegisterDigitalInput2Status = 34165,
        RegisterDigitalOutputCommand = 37051,
        RegisterDigitalOutputStatus = 37052,
        // Identification
        RegisterPanelServerDeviceAddress = 504,
        RegisterDeviceName = 31000,
        RegisterDeviceType = 31024,
        RegisterCommercialReference = 31060
    };

    enum OutputCommand {
        OutputCommandNone = 0,
        OutputCommandOff = 1,
        OutputCommandOn = 2
    };

    enum Error {
        ErrorNoError,
        ErrorRequest,
        ErrorDecode
    };

    static const int panelServerSlotCount = 99;
    static const int panelServerRegistersPerSlot = 5;

    PowerTagRegisterReader(PowerTagModbusSession *session, int timeout);

    Error lastError() const;
    PowerTagModbusSession::RequestError requestError() const;
    quint8 exceptionCode() const;
    QString errorString() const;

    // Block layout of one poll. The voltage block depends on the voltage mode.
    static QVector<PowerTagRegisterBlock> energyBlocks(PowerTagModel::VoltageMode voltageMode);
    static QVector<PowerTagRegisterBlock> heatTagBlocks();
    static QVector<PowerTagRegisterBlock> control2DIBlocks();
    static QVector<PowerTagRegisterBlock> controlIOBlocks();

    // Measurements, the session must already address the device
    bool readEnergyRegisters(PowerTagModel::VoltageMode voltageMode, EnergyPollResult *result);
    bool readHeatTagRegisters(HeatTagPollResult *result);
    bool readControl2DIRegisters(Control2DIPollResult *result);
    bool readControlIORegisters(ControlIOPollResult *result);

    bool writeControlIOOutput(bool on);

    // Identification
    bool readDeviceType(quint16 *typeId);
    bool readDeviceName(QString *name);
    bool readCommercialReference(QString *reference);
    // Occupied slots only, slot number (1-99) -> unit id. The session must address the gateway.
    bool readPanelServerDeviceAddresses(QMap<int, quint16> *addresses);

private:
    PowerTagModbusSession *m_session = nullptr;
    int m_timeout = 500;
    Error m_lastError = ErrorNoError;
    PowerTagModbusSession::RequestError m_requestError = PowerTagModbusSession::RequestErrorNoError;
    quint8 m_exceptionCode = 0;
    QString m_errorString;

    bool readBlocks(const QVector<PowerTagRegisterBlock> &blocks, QVector<QByteArray> *buffers);
    void setDecodeError(const QString &what);
};

#endif // POWERTAGREGISTERREADER_H
