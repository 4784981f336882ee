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

#ifndef POWERTAGMODBUSSESSION_H
#define POWERTAGMODBUSSESSION_H

#include <QObject>
#include <QVector>
#include <QDebug>

struct PowerTagRegisterBlock
{
    quint16 startRegister = 0;
    quint16 registerCount = 0;
};

/*
 * One Modbus TCP connection to a gateway. Every request targets the unit id
 * selected with setUnitId(). Requests block until the reply arrived or the
 * timeout expired. While a request is in flight the session is busy and
 * neither the unit id nor new requests are accepted.
 */
class PowerTagModbusSession : public QObject
{
    Q_OBJECT
public:
    // Protocol ceiling for function code 3
    static const int maxRegistersPerRead = 125;
    static const quint8 gatewayUnitId = 255;

    enum ConnectionError {
        ConnectionErrorNoError,
        ConnectionErrorTimeout,
        ConnectionErrorRefused,
        ConnectionErrorBusy
    };
    Q_ENUM(ConnectionError)

    enum RequestError {
        RequestErrorNoError,
        RequestErrorTimeout,
        RequestErrorException,
        RequestErrorNotConnected,
        RequestErrorBusy,
        RequestErrorInvalidRequest,
        RequestErrorReply
    };
    Q_ENUM(RequestError)

    struct Result
    {
        RequestError error = RequestErrorNoError;
        quint8 exceptionCode = 0;
        QVector<quint16> values;

        bool isSuccess() const { return error == RequestErrorNoError; }
    };

    explicit PowerTagModbusSession(QObject *parent = nullptr);
    virtual ~PowerTagModbusSession() = default;

    quint8 unitId() const;
    bool setUnitId(quint8 unitId);

    virtual bool connected() const = 0;
    virtual bool busy() const = 0;

    virtual Result readHoldingRegisters(quint16 startRegister, quint16 registerCount, int timeout) = 0;

    // Sends all requests before waiting for any of them and returns once every reply has been received.
    // The default implementation reads the blocks one after another.
    virtual QVector<Result> readHoldingRegisterBlocks(const QVector<PowerTagRegisterBlock> &blocks, int timeout);

    virtual Result writeSingleRegister(quint16 registerAddress, quint16 value, int timeout) = 0;

    virtual void close() = 0;

    static bool validReadRequest(quint16 registerCount);

protected:
    quint8 m_unitId = 1;
};

QDebug operator<<(QDebug debug, const PowerTagModbusSession::Result &result);

#endif // POWERTAGMODBUSSESSION_H
