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

#include "powertagdiscovery.h"
#include "powertagregisterreader.h"
#include "loggingcategories.h"

#include <QTime>

NYMEA_LOGGING_CATEGORY(dcPowerTagDiscovery, "PowerTagDiscovery")

static PowerTagDiscovery::ScanRange scanRange(quint8 firstUnitId, int endUnitId, int maxConsecutiveFailures)
{
    PowerTagDiscovery::ScanRange range;
    range.firstUnitId = firstUnitId;
    range.endUnitId = endUnitId;
    range.maxConsecutiveFailures = maxConsecutiveFailures;
    return range;
}

PowerTagDiscovery::Settings::Settings()
{
    // Smartlink devices are densely packed from 150 on, the neighbouring ranges rarely hold devices
    scanRanges << scanRange(150, 170, 10)
               << scanRange(100, 150, 3)
               << scanRange(170, 200, 3);
}

PowerTagDiscovery::PowerTagDiscovery(const PowerTagModelRegistry &modelRegistry, PowerTagModbusSession *session,
                                     const Settings &settings, QObject *parent) :
    QObject(parent),
    m_modelRegistry(modelRegistry),
    m_session(session),
    m_settings(settings)
{

}

void PowerTagDiscovery::startDiscovery()
{
    m_discoveryResults.clear();
    m_timer.start();

    if (!m_session->connected()) {
        qCWarning(dcPowerTagDiscovery()) << "Discovery: The gateway session is not connected.";
        emit discoveryFinished();
        return;
    }

    // Panel Server first: fast when the gateway supports it, a single timeout when not
    bool tableAvailable = false;
    m_discoveryResults = discoverViaPanelServer(&tableAvailable);
    if (tableAvailable) {
        qCDebug(dcPowerTagDiscovery()) << "Discovery: Panel Server discovery found" << m_discoveryResults.count() << "devices";
    } else {
        qCDebug(dcPowerTagDiscovery()) << "Discovery: Panel Server discovery not available, falling back to Smartlink scan";
    }

    if (m_discoveryResults.isEmpty()) {
        foreach (const ScanRange &range, m_settings.scanRanges) {
            if (deadlineExceeded()) {
                qCWarning(dcPowerTagDiscovery()) << "Discovery: Time limit of" << m_settings.discoveryTimeout << "ms reached, skipping the remaining scan ranges";
                break;
            }
            m_discoveryResults.append(scanUnitRange(range));
        }
        qCDebug(dcPowerTagDiscovery()) << "Discovery: Smartlink scan found" << m_discoveryResults.count() << "devices";
    }

    qCInfo(dcPowerTagDiscovery()) << "Discovery: Finished the discovery process. Found" << m_discoveryResults.count()
                                  << "PowerTag devices in" << QTime::fromMSecsSinceStartOfDay(m_timer.elapsed()).toString("mm:ss.zzz");
    emit discoveryFinished();
}

QList<PowerTagDiscovery::Result> PowerTagDiscovery::discoveryResults() const
{
    return m_discoveryResults;
}

QList<PowerTagDiscovery::Result> PowerTagDiscovery::discoverViaPanelServer(bool *tableAvailable)
{
    QList<Result> results;
    if (tableAvailable)
        *tableAvailable = false;

    if (!m_session->setUnitId(PowerTagModbusSession::gatewayUnitId))
        return results;

    PowerTagRegisterReader reader(m_session, m_settings.readTimeout);
    QMap<int, quint16> addresses;
    if (!reader.readPanelServerDeviceAddresses(&addresses)) {
        qCDebug(dcPowerTagDiscovery()) << "Discovery: Reading the Panel Server address table failed:" << reader.errorString();
        return results;
    }

    if (tableAvailable)
        *tableAvailable = true;

    qCDebug(dcPowerTagDiscovery()) << "Discovery: Panel Server address table lists" << addresses.count() << "devices";

    foreach (int slot, addresses.keys()) {
        if (deadlineExceeded()) {
            qCWarning(dcPowerTagDiscovery()) << "Discovery: Time limit reached, skipping the remaining Panel Server slots";
            break;
        }

        quint16 unitId = addresses.value(slot);
        if (unitId > 247) {
            qCDebug(dcPowerTagDiscovery()) << "Discovery: Slot" << slot << "holds the invalid unit id" << unitId << ", skipping";
            continue;
        }

        if (!m_session->setUnitId(static_cast<quint8>(unitId)))
            continue;

        QString reference;
        if (!reader.readCommercialReference(&reference)) {
            qCDebug(dcPowerTagDiscovery()) << "Discovery: Slot" << slot << "( unit" << unitId << "): read failed, skipping";
            continue;
        }

        if (reference.isEmpty()) {
            qCDebug(dcPowerTagDiscovery()) << "Discovery: Slot" << slot << "( unit" << unitId << "): empty reference, skipping";
            continue;
        }

        PowerTagModel model = m_modelRegistry.lookupByCommercialReference(reference);
        if (!model.isValid()) {
            qCDebug(dcPowerTagDiscovery()) << "Discovery: Slot" << slot << "( unit" << unitId << "): unknown reference" << reference << ", skipping";
            continue;
        }

        Result result;
        result.unitId = static_cast<quint8>(unitId);
        result.typeId = model.typeId();
        result.model = model;
        result.name = readDeviceNameOptional(reader);
        result.slot = slot;
        results.append(result);

        qCDebug(dcPowerTagDiscovery()) << "Discovery: --> Found" << result;
    }

    return results;
}

QList<PowerTagDiscovery::Result> PowerTagDiscovery::scanUnitRange(const ScanRange &range)
{
    QList<Result> results;
    int firstUnitId = qMax(1, static_cast<int>(range.firstUnitId));
    int endUnitId = qMin(248, range.endUnitId);

    qCDebug(dcPowerTagDiscovery()) << "Discovery: Scanning unit ids" << firstUnitId << "-" << endUnitId - 1;

    PowerTagRegisterReader reader(m_session, m_settings.readTimeout);
    int consecutiveFailures = 0;
    for (int unitId = firstUnitId; unitId < endUnitId; unitId++) {
        if (deadlineExceeded()) {
            qCWarning(dcPowerTagDiscovery()) << "Discovery: Time limit reached, stopping the scan at unit id" << unitId;
            break;
        }

        if (!m_session->setUnitId(static_cast<quint8>(unitId)))
            break;

        quint16 typeId = 0;
        if (!reader.readDeviceType(&typeId)) {
            // Device ids are densely packed, a run of missing answers means the end of the populated addresses
            consecutiveFailures++;
            if (consecutiveFailures >= range.maxConsecutiveFailures) {
                qCDebug(dcPowerTagDiscovery()) << "Discovery: Stopping scan after" << consecutiveFailures << "consecutive failures at unit id" << unitId;
                break;
            }
            continue;
        }

        consecutiveFailures = 0;
        if (typeId == 0 || typeId == 0xFFFF)
            continue;

        PowerTagModel model = m_modelRegistry.lookupByTypeId(typeId);
        if (!model.isValid()) {
            qCInfo(dcPowerTagDiscovery()) << "Discovery: Unknown device type" << typeId << "at unit id" << unitId << ", skipping";
            continue;
        }

        Result result;
        result.unitId = static_cast<quint8>(unitId);
        result.typeId = typeId;
        result.model = model;
        result.name = readDeviceNameOptional(reader);
        results.append(result);

        qCDebug(dcPowerTagDiscovery()) << "Discovery: --> Found" << result;
    }

    return results;
}

bool PowerTagDiscovery::deadlineExceeded() const
{
    if (m_settings.discoveryTimeout <= 0 || !m_timer.isValid())
        return false;

    return m_timer.hasExpired(m_settings.discoveryTimeout);
}

QString PowerTagDiscovery::readDeviceNameOptional(PowerTagRegisterReader &reader)
{
    // Not every gateway implements the name register
    QString name;
    if (!reader.readDeviceName(&name)) {
        qCDebug(dcPowerTagDiscovery()) << "Discovery: No device name available for unit id" << m_session->unitId();
        return QString();
    }
    return name;
}

QDebug operator<<(QDebug debug, const PowerTagDiscovery::Result &result)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "PowerTagDevice(unit id: " << result.unitId << ", type: " << result.typeId
                    << ", " << result.model.commercialReference() << ", name: " << result.name;
    if (result.slot > 0)
        debug.nospace() << ", slot: " << result.slot;

    debug.nospace() << ")";
    return debug;
}
