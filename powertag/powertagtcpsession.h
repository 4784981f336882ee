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

#ifndef POWERTAGTCPSESSION_H
#define POWERTAGTCPSESSION_H

#include <QObject>
#include <QModbusTcpClient>
#include <QModbusReply>

#include "powertagmodbussession.h"

struct GatewayEndpoint
{
    QString address;
    quint16 port = 502;
};

QDebug operator<<(QDebug debug, const GatewayEndpoint &endpoint);

class PowerTagTcpSession : public PowerTagModbusSession
{
    Q_OBJECT
public:
    explicit PowerTagTcpSession(QObject *parent = nullptr);
    ~PowerTagTcpSession() override;

    GatewayEndpoint endpoint() const;

    ConnectionError connectDevice(const GatewayEndpoint &endpoint, int connectTimeout);

    bool connected() const override;
    bool busy() const override;

    Result readHoldingRegisters(quint16 startRegister, quint16 registerCount, int timeout) override;
    QVector<Result> readHoldingRegisterBlocks(const QVector<PowerTagRegisterBlock> &blocks, int timeout) override;
    Result writeSingleRegister(quint16 registerAddress, quint16 value, int timeout) override;

    void close() override;

signals:
    void connectingChanged(bool connecting);

private:
    QModbusTcpClient *m_modbusTcpClient = nullptr;
    GatewayEndpoint m_endpoint;
    bool m_busy = false;
    bool m_connecting = false;

    QVector<Result> sendAndWait(const QVector<QModbusDataUnit> &requests, bool write, int timeout);
    Result resultFromReply(QModbusReply *reply) const;
    void setConnecting(bool connecting);
};

#endif // POWERTAGTCPSESSION_H
