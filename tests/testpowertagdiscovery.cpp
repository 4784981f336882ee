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

#include <gtest/gtest.h>

#include <QLoggingCategory>

#include "powertagdiscovery.h"
#include "powertagregisterreader.h"
#include "fakegatewaysession.h"

static PowerTagDiscovery::ScanRange makeRange(quint8 firstUnitId, int endUnitId, int maxConsecutiveFailures)
{
    PowerTagDiscovery::ScanRange range;
    range.firstUnitId = firstUnitId;
    range.endUnitId = endUnitId;
    range.maxConsecutiveFailures = maxConsecutiveFailures;
    return range;
}

struct CapturedMessage
{
    QtMsgType type;
    QString category;
    QString message;
};

static QList<CapturedMessage> s_capturedMessages;

static void captureMessage(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    CapturedMessage captured;
    captured.type = type;
    captured.category = QString::fromLatin1(context.category);
    captured.message = message;
    s_capturedMessages.append(captured);
}

class PowerTagDiscoveryTest : public ::testing::Test
{
protected:
    PowerTagModelRegistry registry;
    FakeGatewaySession session;

    QVector<quint16> emptyAddressTable() const
    {
        return QVector<quint16>(PowerTagRegisterReader::panelServerSlotCount * PowerTagRegisterReader::panelServerRegistersPerSlot, 0);
    }

    void setAddressTable(const QVector<quint16> &table)
    {
        session.setRegisters(PowerTagModbusSession::gatewayUnitId, PowerTagRegisterReader::RegisterPanelServerDeviceAddress, table);
    }

    void addPanelServerDevice(quint8 unitId, const QByteArray &reference, const QByteArray &name = QByteArray())
    {
        session.setAscii(unitId, PowerTagRegisterReader::RegisterCommercialReference, reference, 16);
        if (!name.isEmpty())
            session.setAscii(unitId, PowerTagRegisterReader::RegisterDeviceName, name, 10);
    }

    void addSmartlinkDevice(quint8 unitId, quint16 typeId, const QByteArray &name = QByteArray())
    {
        session.setRegisters(unitId, PowerTagRegisterReader::RegisterDeviceType, QVector<quint16>() << typeId);
        if (!name.isEmpty())
            session.setAscii(unitId, PowerTagRegisterReader::RegisterDeviceName, name, 10);
    }

    int scanRequestCount() const
    {
        int count = 0;
        foreach (const FakeGatewaySession::Request &request, session.requests()) {
            if (request.unitId != PowerTagModbusSession::gatewayUnitId)
                count++;
        }
        return count;
    }
};

TEST_F(PowerTagDiscoveryTest, PanelServerSingleSlot)
{
    QVector<quint16> table = emptyAddressTable();
    table[(5 - 1) * 5] = 42;
    setAddressTable(table);
    addPanelServerDevice(42, "A9MEM1541", "Kitchen");

    PowerTagDiscovery discovery(registry, &session);
    discovery.startDiscovery();

    QList<PowerTagDiscovery::Result> results = discovery.discoveryResults();
    ASSERT_EQ(results.count(), 1);
    EXPECT_EQ(results.first().unitId, 42);
    EXPECT_EQ(results.first().typeId, 45);
    EXPECT_EQ(results.first().model.commercialReference(), QString("A9MEM1541"));
    EXPECT_EQ(results.first().name, QString("Kitchen"));
    EXPECT_EQ(results.first().slot, 5);

    // Nothing scanned once the table delivered devices
    foreach (const FakeGatewaySession::Request &request, session.requests()) {
        EXPECT_TRUE(request.unitId == PowerTagModbusSession::gatewayUnitId || request.unitId == 42);
    }
}

TEST_F(PowerTagDiscoveryTest, PanelServerSkipsInvalidEntries)
{
    QVector<quint16> table = emptyAddressTable();
    table[(1 - 1) * 5] = 250;
    table[(2 - 1) * 5] = 0xFFFF;
    table[(3 - 1) * 5] = 43;
    table[(4 - 1) * 5] = 44;
    table[(6 - 1) * 5] = 45;
    table[(8 - 1) * 5] = 46;
    setAddressTable(table);

    addPanelServerDevice(43, "A9MEM1560");
    // Empty reference
    addPanelServerDevice(44, "");
    // Unknown model
    addPanelServerDevice(45, "XYZ123");
    // Unit 46 does not answer

    PowerTagDiscovery discovery(registry, &session);
    discovery.startDiscovery();

    QList<PowerTagDiscovery::Result> results = discovery.discoveryResults();
    ASSERT_EQ(results.count(), 1);
    EXPECT_EQ(results.first().unitId, 43);
    EXPECT_EQ(results.first().model.commercialReference(), QString("A9MEM1560"));
    EXPECT_EQ(session.requestCount(250), 0);
}

TEST_F(PowerTagDiscoveryTest, MissingNameIsNotFatal)
{
    QVector<quint16> table = emptyAddressTable();
    table[0] = 10;
    setAddressTable(table);
    addPanelServerDevice(10, "A9XMC1D3");

    PowerTagDiscovery discovery(registry, &session);
    discovery.startDiscovery();

    QList<PowerTagDiscovery::Result> results = discovery.discoveryResults();
    ASSERT_EQ(results.count(), 1);
    EXPECT_TRUE(results.first().name.isEmpty());
    EXPECT_EQ(results.first().model.family(), PowerTagModel::FamilyControlIO);
}

TEST_F(PowerTagDiscoveryTest, FallsBackToRangeScan)
{
    // The gateway does not answer the address table
    addSmartlinkDevice(150, 81, "Oven");
    addSmartlinkDevice(151, 0xFFFF);
    addSmartlinkDevice(152, 999);
    addSmartlinkDevice(153, 0);
    addSmartlinkDevice(154, 103);

    PowerTagDiscovery::Settings settings;
    settings.scanRanges = QVector<PowerTagDiscovery::ScanRange>() << makeRange(150, 170, 3);
    PowerTagDiscovery discovery(registry, &session, settings);
    discovery.startDiscovery();

    QList<PowerTagDiscovery::Result> results = discovery.discoveryResults();
    ASSERT_EQ(results.count(), 2);
    EXPECT_EQ(results.at(0).unitId, 150);
    EXPECT_EQ(results.at(0).typeId, 81);
    EXPECT_EQ(results.at(0).name, QString("Oven"));
    EXPECT_EQ(results.at(0).slot, -1);
    EXPECT_EQ(results.at(1).unitId, 154);
    EXPECT_EQ(results.at(1).model.family(), PowerTagModel::FamilyControl2DI);

    // 155, 156 and 157 time out
    EXPECT_EQ(session.requestCount(157), 1);
    EXPECT_EQ(session.requestCount(158), 0);
}

TEST_F(PowerTagDiscoveryTest, UnknownDeviceTypeIsLoggedAtInfoLevel)
{
    addSmartlinkDevice(60, 999);
    addSmartlinkDevice(61, 81);

    QLoggingCategory::setFilterRules("PowerTagDiscovery.info=true");
    s_capturedMessages.clear();
    QtMessageHandler previousHandler = qInstallMessageHandler(captureMessage);

    PowerTagDiscovery discovery(registry, &session);
    QList<PowerTagDiscovery::Result> results = discovery.scanUnitRange(makeRange(60, 62, 3));

    qInstallMessageHandler(previousHandler);
    QLoggingCategory::setFilterRules(QString());

    // The scan goes on after the unknown device
    ASSERT_EQ(results.count(), 1);
    EXPECT_EQ(results.first().unitId, 61);

    int unknownTypeMessages = 0;
    foreach (const CapturedMessage &captured, s_capturedMessages) {
        if (!captured.message.contains("Unknown device type"))
            continue;

        unknownTypeMessages++;
        EXPECT_EQ(captured.type, QtInfoMsg);
        EXPECT_EQ(captured.category, QString("PowerTagDiscovery"));
        EXPECT_TRUE(captured.message.contains("999"));
        EXPECT_TRUE(captured.message.contains("60"));
    }
    EXPECT_EQ(unknownTypeMessages, 1);
}

TEST_F(PowerTagDiscoveryTest, EmptyAddressTableFallsBackToRangeScan)
{
    setAddressTable(emptyAddressTable());
    addSmartlinkDevice(100, 41);

    PowerTagDiscovery::Settings settings;
    settings.scanRanges = QVector<PowerTagDiscovery::ScanRange>() << makeRange(100, 150, 3);
    PowerTagDiscovery discovery(registry, &session, settings);
    discovery.startDiscovery();

    QList<PowerTagDiscovery::Result> results = discovery.discoveryResults();
    ASSERT_EQ(results.count(), 1);
    EXPECT_EQ(results.first().unitId, 100);
}

TEST_F(PowerTagDiscoveryTest, ScanStopsAfterConsecutiveTimeouts)
{
    PowerTagDiscovery discovery(registry, &session);
    QList<PowerTagDiscovery::Result> results = discovery.scanUnitRange(makeRange(1, 248, 3));

    EXPECT_TRUE(results.isEmpty());
    EXPECT_EQ(session.requests().count(), 3);
}

TEST_F(PowerTagDiscoveryTest, SilentGatewayCostsThreeRequestsPerRange)
{
    PowerTagDiscovery::Settings settings;
    settings.scanRanges = QVector<PowerTagDiscovery::ScanRange>() << makeRange(100, 150, 3);
    PowerTagDiscovery discovery(registry, &session, settings);
    discovery.startDiscovery();

    EXPECT_TRUE(discovery.discoveryResults().isEmpty());
    EXPECT_EQ(scanRequestCount(), 3);
}

TEST_F(PowerTagDiscoveryTest, ExceptionCountsAsMissingDevice)
{
    session.setUnitException(1, 0x01);
    session.setUnitException(2, 0x01);

    PowerTagDiscovery discovery(registry, &session);
    QList<PowerTagDiscovery::Result> results = discovery.scanUnitRange(makeRange(1, 10, 2));

    EXPECT_TRUE(results.isEmpty());
    EXPECT_EQ(session.requests().count(), 2);
}

TEST_F(PowerTagDiscoveryTest, AnyAnswerResetsTheFailureCount)
{
    addSmartlinkDevice(3, 0);
    addSmartlinkDevice(6, 82);

    PowerTagDiscovery discovery(registry, &session);
    QList<PowerTagDiscovery::Result> results = discovery.scanUnitRange(makeRange(1, 20, 3));

    ASSERT_EQ(results.count(), 1);
    EXPECT_EQ(results.first().unitId, 6);
    // 1, 2 fail, 3 answers, 4, 5 fail, 6 answers, 7, 8, 9 fail
    EXPECT_EQ(session.requestCount(9), 1);
    EXPECT_EQ(session.requestCount(10), 0);
}

TEST_F(PowerTagDiscoveryTest, ScanRangeIsClampedToValidUnitIds)
{
    PowerTagDiscovery discovery(registry, &session);
    discovery.scanUnitRange(makeRange(245, 300, 100));

    QVector<FakeGatewaySession::Request> requests = session.requests();
    ASSERT_EQ(requests.count(), 3);
    EXPECT_EQ(requests.first().unitId, 245);
    EXPECT_EQ(requests.last().unitId, 247);

    session.clearRequests();
    discovery.scanUnitRange(makeRange(0, 3, 100));
    requests = session.requests();
    ASSERT_EQ(requests.count(), 2);
    EXPECT_EQ(requests.first().unitId, 1);
}

TEST_F(PowerTagDiscoveryTest, RangesRunInOrder)
{
    addSmartlinkDevice(160, 85);
    addSmartlinkDevice(120, 102);

    PowerTagDiscovery::Settings settings;
    settings.scanRanges = QVector<PowerTagDiscovery::ScanRange>() << makeRange(160, 165, 10) << makeRange(120, 125, 10);
    PowerTagDiscovery discovery(registry, &session, settings);
    discovery.startDiscovery();

    QList<PowerTagDiscovery::Result> results = discovery.discoveryResults();
    ASSERT_EQ(results.count(), 2);
    EXPECT_EQ(results.at(0).unitId, 160);
    EXPECT_EQ(results.at(1).unitId, 120);
    EXPECT_EQ(results.at(1).model.family(), PowerTagModel::FamilyHeatTag);
}

TEST_F(PowerTagDiscoveryTest, NotConnectedFinishesEmpty)
{
    session.setConnected(false);

    PowerTagDiscovery discovery(registry, &session);
    bool finished = false;
    QObject::connect(&discovery, &PowerTagDiscovery::discoveryFinished, [&finished]() { finished = true; });
    discovery.startDiscovery();

    EXPECT_TRUE(finished);
    EXPECT_TRUE(discovery.discoveryResults().isEmpty());
    EXPECT_TRUE(session.requests().isEmpty());
}

TEST_F(PowerTagDiscoveryTest, DefaultScanRanges)
{
    PowerTagDiscovery::Settings settings;
    ASSERT_EQ(settings.scanRanges.count(), 3);
    EXPECT_EQ(settings.scanRanges.at(0).firstUnitId, 150);
    EXPECT_EQ(settings.scanRanges.at(0).endUnitId, 170);
    EXPECT_EQ(settings.scanRanges.at(0).maxConsecutiveFailures, 10);
    EXPECT_EQ(settings.scanRanges.at(1).firstUnitId, 100);
    EXPECT_EQ(settings.scanRanges.at(1).maxConsecutiveFailures, 3);
    EXPECT_EQ(settings.scanRanges.at(2).firstUnitId, 170);
    EXPECT_EQ(settings.scanRanges.at(2).endUnitId, 200);
}
