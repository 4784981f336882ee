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

#include "powertagregisterreader.h"
#include "powertagdatautils.h"
#include "loggingcategories.h"

#include <QDebug>

NYMEA_LOGGING_CATEGORY(dcPowerTagRegisterReader, "PowerTagRegisterReader")

const int PowerTagRegisterReader::panelServerSlotCount;
const int PowerTagRegisterReader::panelServerRegistersPerSlot;

static PowerTagRegisterBlock registerBlock(quint16 startRegister, quint16 registerCount)
{
    PowerTagRegisterBlock block;
    block.startRegister = startRegister;
    block.registerCount = registerCount;
    return block;
}

PowerTagRegisterReader::PowerTagRegisterReader(PowerTagModbusSession *session, int timeout) :
    m_session(session),
    m_timeout(timeout)
{

}

PowerTagRegisterReader::Error PowerTagRegisterReader::lastError() const
{
    return m_lastError;
}

PowerTagModbusSession::RequestError PowerTagRegisterReader::requestError() const
{
    return m_requestError;
}

quint8 PowerTagRegisterReader::exceptionCode() const
{
    return m_exceptionCode;
}

QString PowerTagRegisterReader::errorString() const
{
    return m_errorString;
}

/*
 * Adjacent registers are coalesced so one poll needs 7 transactions:
 *   current L1/L2/L3          2999-3004
 *   voltage L-L or L-N        3019-3024 / 3027-3032
 *   power L1/L2/L3 + total    3053-3060
 *   power factor              3083-3084
 *   frequency                 3109-3110
 *   temperature               3131-3132
 *   total energy (int64, Wh)  3203-3206
 */
QVector<PowerTagRegisterBlock> PowerTagRegisterReader::energyBlocks(PowerTagModel::VoltageMode voltageMode)
{
    quint16 voltageStart = voltageMode == PowerTagModel::VoltageModeLineToLine ? RegisterVoltageLL1 : RegisterVoltageLN1;
    return QVector<PowerTagRegisterBlock>()
            << registerBlock(RegisterCurrentL1, 6)
            << registerBlock(voltageStart, 6)
            << registerBlock(RegisterPowerL1, 8)
            << registerBlock(RegisterPowerFactor, 2)
            << registerBlock(RegisterFrequency, 2)
            << registerBlock(RegisterTemperature, 2)
            << registerBlock(RegisterEnergyTotal, 4);
}

QVector<PowerTagRegisterBlock> PowerTagRegisterReader::heatTagBlocks()
{
    return QVector<PowerTagRegisterBlock>()
            << registerBlock(RegisterHeatTagTemperature, 2)
            << registerBlock(RegisterHeatTagHumidity, 2)
            << registerBlock(RegisterHeatTagAlarm, 1);
}

QVector<PowerTagRegisterBlock> PowerTagRegisterReader::control2DIBlocks()
{
    return QVector<PowerTagRegisterBlock>()
            << registerBlock(RegisterDigitalInput1Status, 1)
            << registerBlock(RegisterDigitalInput2Status, 1);
}

QVector<PowerTagRegisterBlock> PowerTagRegisterReader::controlIOBlocks()
{
    return QVector<PowerTagRegisterBlock>()
            << registerBlock(RegisterDigitalInput1Status, 1)
            << registerBlock(RegisterDigitalOutputStatus, 1);
}

bool PowerTagRegisterReader::readEnergyRegisters(PowerTagModel::VoltageMode voltageMode, EnergyPollResult *result)
{
    QVector<QByteArray> buffers;
    if (!readBlocks(energyBlocks(voltageMode), &buffers))
        return false;

    const QByteArray &currentBuffer = buffers.at(0);
    const QByteArray &voltageBuffer = buffers.at(1);
    const QByteArray &powerBuffer = buffers.at(2);

    bool ok = true;
    bool valueOk = false;
    EnergyPollResult pollResult;
    pollResult.currentL1 = PowerTagDataUtils::decodeFloat32(currentBuffer, 0, &valueOk); ok &= valueOk;
    pollResult.currentL2 = PowerTagDataUtils::decodeFloat32(currentBuffer, 4, &valueOk); ok &= valueOk;
    pollResult.currentL3 = PowerTagDataUtils::decodeFloat32(currentBuffer, 8, &valueOk); ok &= valueOk;
    pollResult.voltagePh1 = PowerTagDataUtils::decodeFloat32(voltageBuffer, 0, &valueOk); ok &= valueOk;
    pollResult.voltagePh2 = PowerTagDataUtils::decodeFloat32(voltageBuffer, 4, &valueOk); ok &= valueOk;
    pollResult.voltagePh3 = PowerTagDataUtils::decodeFloat32(voltageBuffer, 8, &valueOk); ok &= valueOk;
    pollResult.powerL1 = PowerTagDataUtils::decodeFloat32(powerBuffer, 0, &valueOk); ok &= valueOk;
    pollResult.powerL2 = PowerTagDataUtils::decodeFloat32(powerBuffer, 4, &valueOk); ok &= valueOk;
    pollResult.powerL3 = PowerTagDataUtils::decodeFloat32(powerBuffer, 8, &valueOk); ok &= valueOk;
    pollResult.totalPower = PowerTagDataUtils::decodeFloat32(powerBuffer, 12, &valueOk); ok &= valueOk;
    pollResult.powerFactor = PowerTagDataUtils::decodeFloat32(buffers.at(3), 0, &valueOk); ok &= valueOk;
    pollResult.frequency = PowerTagDataUtils::decodeFloat32(buffers.at(4), 0, &valueOk); ok &= valueOk;
    pollResult.temperature = PowerTagDataUtils::decodeFloat32(buffers.at(5), 0, &valueOk); ok &= valueOk;
    pollResult.totalEnergy = PowerTagDataUtils::decodeScaledInt64(buffers.at(6), 0, 1000, &valueOk); ok &= valueOk;

    if (!ok) {
        setDecodeError("energy measurements");
        return false;
    }

    *result = pollResult;
    return true;
}

bool PowerTagRegisterReader::readHeatTagRegisters(HeatTagPollResult *result)
{
    QVector<QByteArray> buffers;
    if (!readBlocks(heatTagBlocks(), &buffers))
        return false;

    bool ok = true;
    bool valueOk = false;
    HeatTagPollResult pollResult;
    pollResult.temperature = PowerTagDataUtils::decodeFloat32(buffers.at(0), 0, &valueOk); ok &= valueOk;
    // Stored as a fraction, 0.5 means 50 %
    pollResult.humidity = PowerTagDataUtils::decodeFloat32(buffers.at(1), 0, &valueOk) * 100; ok &= valueOk;
    pollResult.alarmLevel = PowerTagDataUtils::decodeUInt16(buffers.at(2), 0, &valueOk); ok &= valueOk;

    if (!ok) {
        setDecodeError("HeatTag measurements");
        return false;
    }

    *result = pollResult;
    return true;
}

bool PowerTagRegisterReader::readControl2DIRegisters(Control2DIPollResult *result)
{
    QVector<QByteArray> buffers;
    if (!readBlocks(control2DIBlocks(), &buffers))
        return false;

    bool ok = true;
    bool valueOk = false;
    // Input registers: 0 = on, 1 = off
    Control2DIPollResult pollResult;
    pollResult.di1Status = PowerTagDataUtils::decodeUInt16(buffers.at(0), 0, &valueOk) == 0; ok &= valueOk;
    pollResult.di2Status = PowerTagDataUtils::decodeUInt16(buffers.at(1), 0, &valueOk) == 0; ok &= valueOk;

    if (!ok) {
        setDecodeError("digital input states");
        return false;
    }

    *result = pollResult;
    return true;
}

bool PowerTagRegisterReader::readControlIORegisters(ControlIOPollResult *result)
{
    QVector<QByteArray> buffers;
    if (!readBlocks(controlIOBlocks(), &buffers))
        return false;

    bool ok = true;
    bool valueOk = false;
    ControlIOPollResult pollResult;
    pollResult.di1Status = PowerTagDataUtils::decodeUInt16(buffers.at(0), 0, &valueOk) == 0; ok &= valueOk;
    // Output status: 0 = off, 1 = on
    pollResult.outputStatus = PowerTagDataUtils::decodeUInt16(buffers.at(1), 0, &valueOk) == 1; ok &= valueOk;

    if (!ok) {
        setDecodeError("input/output states");
        return false;
    }

    *result = pollResult;
    return true;
}

bool PowerTagRegisterReader::writeControlIOOutput(bool on)
{
    quint16 command = on ? OutputCommandOn : OutputCommandOff;
    qCDebug(dcPowerTagRegisterReader()) << "Write output command" << command << "to unit id" << m_session->unitId();

    PowerTagModbusSession::Result result = m_session->writeSingleRegister(RegisterDigitalOutputCommand, command, m_timeout);
    if (!result.isSuccess()) {
        m_lastError = ErrorRequest;
        m_requestError = result.error;
        m_exceptionCode = result.exceptionCode;
        m_errorString = QString("Writing the output command to unit id %1 failed").arg(m_session->unitId());
        qCWarning(dcPowerTagRegisterReader()) << m_errorString << result;
        return false;
    }

    m_lastError = ErrorNoError;
    m_requestError = PowerTagModbusSession::RequestErrorNoError;
    m_exceptionCode = 0;
    m_errorString.clear();
    return true;
}

bool PowerTagRegisterReader::readDeviceType(quint16 *typeId)
{
    QVector<QByteArray> buffers;
    if (!readBlocks(QVector<PowerTagRegisterBlock>() << registerBlock(RegisterDeviceType, 1), &buffers))
        return false;

    bool ok = false;
    quint16 value = PowerTagDataUtils::decodeUInt16(buffers.at(0), 0, &ok);
    if (!ok) {
        setDecodeError("device type");
        return false;
    }

    *typeId = value;
    return true;
}

bool PowerTagRegisterReader::readDeviceName(QString *name)
{
    QVector<QByteArray> buffers;
    if (!readBlocks(QVector<PowerTagRegisterBlock>() << registerBlock(RegisterDeviceName, 10), &buffers))
        return false;

    *name = PowerTagDataUtils::decodeFixedAscii(buffers.at(0));
    return true;
}

bool PowerTagRegisterReader::readCommercialReference(QString *reference)
{
    QVector<QByteArray> buffers;
    if (!readBlocks(QVector<PowerTagRegisterBlock>() << registerBlock(RegisterCommercialReference, 16), &buffers))
        return false;

    *reference = PowerTagDataUtils::decodeFixedAscii(buffers.at(0));
    return true;
}

bool PowerTagRegisterReader::readPanelServerDeviceAddresses(QMap<int, quint16> *addresses)
{
    // 99 slots x 5 registers, chunked to the per transaction limit: 125, 125, 125, 120
    const int tableSize = panelServerSlotCount * panelServerRegistersPerSlot;
    QVector<PowerTagRegisterBlock> blocks;
    for (int offset = 0; offset < tableSize; offset += PowerTagModbusSession::maxRegistersPerRead) {
        int count = qMin(PowerTagModbusSession::maxRegistersPerRead, tableSize - offset);
        blocks.append(registerBlock(RegisterPanelServerDeviceAddress + offset, count));
    }

    QVector<QByteArray> buffers;
    if (!readBlocks(blocks, &buffers))
        return false;

    QByteArray table;
    foreach (const QByteArray &buffer, buffers)
        table.append(buffer);

    QMap<int, quint16> occupiedSlots;
    for (int slot = 1; slot <= panelServerSlotCount; slot++) {
        // The first register of a slot holds the unit id
        bool ok = false;
        quint16 unitId = PowerTagDataUtils::decodeUInt16(table, (slot - 1) * panelServerRegistersPerSlot * 2, &ok);
        if (!ok) {
            setDecodeError("Panel Server device address table");
            return false;
        }

        if (unitId == 0 || unitId == 0xFFFF)
            continue;

        occupiedSlots.insert(slot, unitId);
    }

    *addresses = occupiedSlots;
    return true;
}

bool PowerTagRegisterReader::readBlocks(const QVector<PowerTagRegisterBlock> &blocks, QVector<QByteArray> *buffers)
{
    QVector<PowerTagModbusSession::Result> results = m_session->readHoldingRegisterBlocks(blocks, m_timeout);
    buffers->clear();
    if (results.count() != blocks.count()) {
        m_lastError = ErrorRequest;
        m_requestError = PowerTagModbusSession::RequestErrorReply;
        m_exceptionCode = 0;
        m_errorString = QString("Expected %1 replies but received %2").arg(blocks.count()).arg(results.count());
        qCWarning(dcPowerTagRegisterReader()) << m_errorString;
        return false;
    }

    for (int i = 0; i < results.count(); i++) {
        const PowerTagModbusSession::Result &result = results.at(i);
        if (!result.isSuccess()) {
            m_lastError = ErrorRequest;
            m_requestError = result.error;
            m_exceptionCode = result.exceptionCode;
            m_errorString = QString("Reading register %1 size %2 from unit id %3 failed")
                    .arg(blocks.at(i).startRegister).arg(blocks.at(i).registerCount).arg(m_session->unitId());
            qCDebug(dcPowerTagRegisterReader()) << m_errorString << result;
            return false;
        }
        buffers->append(PowerTagDataUtils::registersToByteArray(result.values));
    }

    m_lastError = ErrorNoError;
    m_requestError = PowerTagModbusSession::RequestErrorNoError;
    m_exceptionCode = 0;
    m_errorString.clear();
    return true;
}

void PowerTagRegisterReader::setDecodeError(const QString &what)
{
    m_lastError = ErrorDecode;
    m_requestError = PowerTagModbusSession::RequestErrorNoError;
    m_exceptionCode = 0;
    m_errorString = QString("Could not decode the %1 of unit id %2").arg(what).arg(m_session->unitId());
    qCWarning(dcPowerTagRegisterReader()) << m_errorString;
}
