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

#include "powertagtcpsession.h"
#include "loggingcategories.h"

#include <QEventLoop>
#include <QTimer>
#include <QDebug>

NYMEA_LOGGING_CATEGORY(dcPowerTagTcpSession, "PowerTagTcpSession")

QDebug operator<<(QDebug debug, const GatewayEndpoint &endpoint)
{
    QDebugStateSaver saver(debug);
    debug.nospace().noquote() << endpoint.address << ":" << endpoint.port;
    return debug;
}

PowerTagTcpSession::PowerTagTcpSession(QObject *parent) :
    PowerTagModbusSession(parent)
{

}

PowerTagTcpSession::~PowerTagTcpSession()
{
    close();
}

GatewayEndpoint PowerTagTcpSession::endpoint() const
{
    return m_endpoint;
}

PowerTagModbusSession::ConnectionError PowerTagTcpSession::connectDevice(const GatewayEndpoint &endpoint, int connectTimeout)
{
    // The client must not be replaced while an earlier attempt or a request still waits on it
    if (m_connecting) {
        qCWarning(dcPowerTagTcpSession()) << "Already connecting to" << m_endpoint << ", rejecting connection attempt to" << endpoint;
        return ConnectionErrorBusy;
    }

    if (m_busy) {
        qCWarning(dcPowerTagTcpSession()) << "Cannot reconnect to" << endpoint << "while a request is pending";
        return ConnectionErrorBusy;
    }

    // A fresh client for every connection attempt, the old one may still be closing
    if (m_modbusTcpClient) {
        close();
        m_modbusTcpClient->deleteLater();
        m_modbusTcpClient = nullptr;
    }

    m_endpoint = endpoint;
    m_modbusTcpClient = new QModbusTcpClient(this);
    m_modbusTcpClient->setConnectionParameter(QModbusDevice::NetworkAddressParameter, endpoint.address);
    m_modbusTcpClient->setConnectionParameter(QModbusDevice::NetworkPortParameter, endpoint.port);
    m_modbusTcpClient->setNumberOfRetries(0);

    setConnecting(true);

    qCDebug(dcPowerTagTcpSession()) << "Connecting to" << endpoint << "timeout" << connectTimeout << "ms";
    if (!m_modbusTcpClient->connectDevice()) {
        qCWarning(dcPowerTagTcpSession()) << "Could not start connecting to" << endpoint << m_modbusTcpClient->errorString();
        setConnecting(false);
        return ConnectionErrorRefused;
    }

    if (m_modbusTcpClient->state() != QModbusDevice::ConnectedState) {
        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        connect(m_modbusTcpClient, &QModbusDevice::stateChanged, &loop, [&loop](QModbusDevice::State state){
            if (state == QModbusDevice::ConnectedState || state == QModbusDevice::UnconnectedState) {
                loop.quit();
            }
        });

        timer.start(connectTimeout);
        loop.exec();

        if (m_modbusTcpClient->state() != QModbusDevice::ConnectedState) {
            bool timedOut = !timer.isActive();
            if (timedOut) {
                qCWarning(dcPowerTagTcpSession()) << "Connection to" << endpoint << "timed out after" << connectTimeout << "ms";
            } else {
                qCWarning(dcPowerTagTcpSession()) << "Connection to" << endpoint << "failed:" << m_modbusTcpClient->errorString();
            }
            close();
            setConnecting(false);
            return timedOut ? ConnectionErrorTimeout : ConnectionErrorRefused;
        }
    }

    setConnecting(false);
    qCDebug(dcPowerTagTcpSession()) << "Connected to" << endpoint;
    return ConnectionErrorNoError;
}

bool PowerTagTcpSession::connected() const
{
    return m_modbusTcpClient && m_modbusTcpClient->state() == QModbusDevice::ConnectedState;
}

bool PowerTagTcpSession::busy() const
{
    return m_busy || m_connecting;
}

PowerTagModbusSession::Result PowerTagTcpSession::readHoldingRegisters(quint16 startRegister, quint16 registerCount, int timeout)
{
    PowerTagRegisterBlock block;
    block.startRegister = startRegister;
    block.registerCount = registerCount;
    return readHoldingRegisterBlocks(QVector<PowerTagRegisterBlock>() << block, timeout).first();
}

QVector<PowerTagModbusSession::Result> PowerTagTcpSession::readHoldingRegisterBlocks(const QVector<PowerTagRegisterBlock> &blocks, int timeout)
{
    QVector<QModbusDataUnit> requests;
    foreach (const PowerTagRegisterBlock &block, blocks) {
        if (!validReadRequest(block.registerCount) || block.startRegister + block.registerCount > 65536) {
            qCWarning(dcPowerTagTcpSession()) << "Invalid read request for register" << block.startRegister << "size:" << block.registerCount;
            Result result;
            result.error = RequestErrorInvalidRequest;
            return QVector<Result>(blocks.count(), result);
        }
        requests.append(QModbusDataUnit(QModbusDataUnit::HoldingRegisters, block.startRegister, block.registerCount));
    }

    return sendAndWait(requests, false, timeout);
}

PowerTagModbusSession::Result PowerTagTcpSession::writeSingleRegister(quint16 registerAddress, quint16 value, int timeout)
{
    QModbusDataUnit request(QModbusDataUnit::HoldingRegisters, registerAddress, 1);
    request.setValue(0, value);
    return sendAndWait(QVector<QModbusDataUnit>() << request, true, timeout).first();
}

void PowerTagTcpSession::close()
{
    if (!m_modbusTcpClient)
        return;

    if (m_modbusTcpClient->state() != QModbusDevice::UnconnectedState) {
        qCDebug(dcPowerTagTcpSession()) << "Closing connection to" << m_endpoint;
        m_modbusTcpClient->disconnectDevice();
    }
}

QVector<PowerTagModbusSession::Result> PowerTagTcpSession::sendAndWait(const QVector<QModbusDataUnit> &requests, bool write, int timeout)
{
    QVector<Result> results(requests.count());

    if (busy()) {
        qCWarning(dcPowerTagTcpSession()) << "Session to" << m_endpoint << "is busy, rejecting request";
        for (int i = 0; i < results.count(); i++)
            results[i].error = RequestErrorBusy;

        return results;
    }

    if (!connected()) {
        qCWarning(dcPowerTagTcpSession()) << "Cannot send request, not connected to" << m_endpoint;
        for (int i = 0; i < results.count(); i++)
            results[i].error = RequestErrorNotConnected;

        return results;
    }

    m_busy = true;
    // QModbusClient ignores timeouts below 10 ms
    m_modbusTcpClient->setTimeout(qMax(timeout, 10));

    QEventLoop loop;
    QVector<bool> finished(requests.count(), false);
    int pendingReplies = 0;
    for (int i = 0; i < requests.count(); i++) {
        const QModbusDataUnit &request = requests.at(i);
        qCDebug(dcPowerTagTcpSession()) << (write ? "--> Write" : "--> Read") << "unit id:" << m_unitId << "register:" << request.startAddress() << "size:" << request.valueCount();

        QModbusReply *reply = write ? m_modbusTcpClient->sendWriteRequest(request, m_unitId)
                                    : m_modbusTcpClient->sendReadRequest(request, m_unitId);
        if (!reply) {
            qCWarning(dcPowerTagTcpSession()) << "Error occurred while sending request to" << m_endpoint << m_modbusTcpClient->errorString();
            results[i].error = RequestErrorReply;
            finished[i] = true;
            continue;
        }

        if (reply->isFinished()) {
            results[i] = resultFromReply(reply);
            finished[i] = true;
            delete reply;
            continue;
        }

        pendingReplies++;
        connect(reply, &QModbusReply::finished, reply, &QModbusReply::deleteLater);
        connect(reply, &QModbusReply::finished, &loop, [this, reply, i, &results, &finished, &pendingReplies, &loop](){
            results[i] = resultFromReply(reply);
            finished[i] = true;
            pendingReplies--;
            if (pendingReplies == 0) {
                loop.quit();
            }
        });
    }

    if (pendingReplies > 0) {
        // The client times out every reply on its own, this only guards against a reply that never finishes
        QTimer guardTimer;
        guardTimer.setSingleShot(true);
        connect(&guardTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
        guardTimer.start(timeout * requests.count() + 1000);
        loop.exec();

        if (pendingReplies > 0) {
            qCWarning(dcPowerTagTcpSession()) << pendingReplies << "replies from" << m_endpoint << "never finished, treating them as timed out";
            for (int i = 0; i < results.count(); i++) {
                if (!finished.at(i)) {
                    results[i].error = RequestErrorTimeout;
                }
            }
        }
    }

    m_busy = false;

    for (int i = 0; i < results.count(); i++) {
        if (results.at(i).isSuccess()) {
            qCDebug(dcPowerTagTcpSession()) << "<-- Response from unit id" << m_unitId << "register" << requests.at(i).startAddress() << results.at(i).values;
        } else {
            qCDebug(dcPowerTagTcpSession()) << "<-- Request to unit id" << m_unitId << "register" << requests.at(i).startAddress() << "failed" << results.at(i);
        }
    }

    return results;
}

PowerTagModbusSession::Result PowerTagTcpSession::resultFromReply(QModbusReply *reply) const
{
    Result result;
    switch (reply->error()) {
    case QModbusDevice::NoError:
        result.values = reply->result().values();
        break;
    case QModbusDevice::TimeoutError:
        result.error = RequestErrorTimeout;
        break;
    case QModbusDevice::ProtocolError:
        if (reply->rawResult().isException()) {
            result.error = RequestErrorException;
            result.exceptionCode = static_cast<quint8>(reply->rawResult().exceptionCode());
        } else {
            result.error = RequestErrorReply;
        }
        break;
    default:
        result.error = RequestErrorReply;
        break;
    }
    return result;
}

void PowerTagTcpSession::setConnecting(bool connecting)
{
    if (m_connecting == connecting)
        return;

    m_connecting = connecting;
    emit connectingChanged(m_connecting);
}
