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

#include "powertagmodbussession.h"
#include "loggingcategories.h"

#include <QDebug>

NYMEA_LOGGING_CATEGORY(dcPowerTagModbusSession, "PowerTagModbusSession")

const int PowerTagModbusSession::maxRegistersPerRead;
const quint8 PowerTagModbusSession::gatewayUnitId;

PowerTagModbusSession::PowerTagModbusSession(QObject *parent) :
    QObject(parent)
{

}

quint8 PowerTagModbusSession::unitId() const
{
    return m_unitId;
}

bool PowerTagModbusSession::setUnitId(quint8 unitId)
{
    if (busy()) {
        qCWarning(dcPowerTagModbusSession()) << "Refusing to switch to unit id" << unitId << "while a request to unit id" << m_unitId << "is pending";
        return false;
    }

    m_unitId = unitId;
    return true;
}

QVector<PowerTagModbusSession::Result> PowerTagModbusSession::readHoldingRegisterBlocks(const QVector<PowerTagRegisterBlock> &blocks, int timeout)
{
    QVector<Result> results;
    results.reserve(blocks.count());
    foreach (const PowerTagRegisterBlock &block, blocks) {
        results.append(readHoldingRegisters(block.startRegister, block.registerCount, timeout));
    }
    return results;
}

bool PowerTagModbusSession::validReadRequest(quint16 registerCount)
{
    return registerCount > 0 && registerCount <= maxRegistersPerRead;
}

QDebug operator<<(QDebug debug, const PowerTagModbusSession::Result &result)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Result(" << result.error;
    if (result.error == PowerTagModbusSession::RequestErrorException)
        debug.nospace() << ", exception: 0x" << QString::number(result.exceptionCode, 16);

    debug.nospace() << ", registers: " << result.values.count() << ")";
    return debug;
}
