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

#ifndef POWERTAGDISCOVERY_H
#define POWERTAGDISCOVERY_H

#include <QObject>
#include <QElapsedTimer>
#include <QList>
#include <QVector>

#include "powertagmodbussession.h"
#include "powertagmodelregistry.h"

class PowerTagRegisterReader;

class PowerTagDiscovery : public QObject
{
    Q_OBJECT
public:
    struct ScanRange
    {
        quint8 firstUnitId = 1;
        // Exclusive
        int endUnitId = 248;
        int maxConsecutiveFailures = 10;
    };

    struct Settings
    {
        Settings();

        int readTimeout = 500;
        // Upper bound for a whole discovery run, 0 disables the limit
        int discoveryTimeout = 120000;
        QVector<ScanRange> scanRanges;
    };

    struct Result
    {
        quint8 unitId = 0;
        quint16 typeId = 0;
        PowerTagModel model;
        QString name;
        // Panel Server slot, -1 if found by scanning
        int slot = -1;
    };

    explicit PowerTagDiscovery(const PowerTagModelRegistry &modelRegistry, PowerTagModbusSession *session,
                               const Settings &settings = Settings(), QObject *parent = nullptr);

    // Runs both strategies on the connected session and emits discoveryFinished() once done
    void startDiscovery();
    QList<Result> discoveryResults() const;

    QList<Result> discoverViaPanelServer(bool *tableAvailable = nullptr);
    QList<Result> scanUnitRange(const ScanRange &range);

signals:
    void discoveryFinished();

private:
    const PowerTagModelRegistry &m_modelRegistry;
    PowerTagModbusSession *m_session = nullptr;
    Settings m_settings;
    QElapsedTimer m_timer;
    QList<Result> m_discoveryResults;

    bool deadlineExceeded() const;
    QString readDeviceNameOptional(PowerTagRegisterReader &reader);
};

QDebug operator<<(QDebug debug, const PowerTagDiscovery::Result &result);

#endif // POWERTAGDISCOVERY_H
