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

#include "powertagdatautils.h"
#include "fakegatewaysession.h"

TEST(PowerTagDataUtils, RegistersAreBigEndian)
{
    QByteArray buffer = PowerTagDataUtils::registersToByteArray(QVector<quint16>() << 0x1234 << 0xABCD);
    ASSERT_EQ(buffer.size(), 4);
    EXPECT_EQ(static_cast<quint8>(buffer.at(0)), 0x12);
    EXPECT_EQ(static_cast<quint8>(buffer.at(1)), 0x34);
    EXPECT_EQ(static_cast<quint8>(buffer.at(2)), 0xAB);
    EXPECT_EQ(static_cast<quint8>(buffer.at(3)), 0xCD);
}

TEST(PowerTagDataUtils, DecodeFloat32)
{
    // 230.5 = 0x43668000
    QByteArray buffer = PowerTagDataUtils::registersToByteArray(QVector<quint16>() << 0x4366 << 0x8000);
    bool ok = false;
    EXPECT_DOUBLE_EQ(PowerTagDataUtils::decodeFloat32(buffer, 0, &ok), 230.5);
    EXPECT_TRUE(ok);
}

TEST(PowerTagDataUtils, DecodeFloat32AtOffset)
{
    QVector<quint16> registers;
    registers << FakeGatewaySession::floatRegisters(1.5f) << FakeGatewaySession::floatRegisters(-42.25f);
    QByteArray buffer = PowerTagDataUtils::registersToByteArray(registers);

    bool ok = false;
    EXPECT_DOUBLE_EQ(PowerTagDataUtils::decodeFloat32(buffer, 4, &ok), -42.25);
    EXPECT_TRUE(ok);
}

TEST(PowerTagDataUtils, ShortBufferIsNotOk)
{
    QByteArray buffer = PowerTagDataUtils::registersToByteArray(QVector<quint16>() << 0x4366);

    bool ok = true;
    EXPECT_EQ(PowerTagDataUtils::decodeFloat32(buffer, 0, &ok), 0.0);
    EXPECT_FALSE(ok);

    ok = true;
    PowerTagDataUtils::decodeUInt16(buffer, 2, &ok);
    EXPECT_FALSE(ok);

    ok = true;
    PowerTagDataUtils::decodeScaledInt64(buffer, 0, 1000, &ok);
    EXPECT_FALSE(ok);

    ok = true;
    PowerTagDataUtils::decodeFloat32(buffer, -1, &ok);
    EXPECT_FALSE(ok);
}

TEST(PowerTagDataUtils, DecodeUInt16)
{
    QByteArray buffer = PowerTagDataUtils::registersToByteArray(QVector<quint16>() << 7 << 0xFFFF);
    bool ok = false;
    EXPECT_EQ(PowerTagDataUtils::decodeUInt16(buffer, 0, &ok), 7);
    EXPECT_TRUE(ok);
    EXPECT_EQ(PowerTagDataUtils::decodeUInt16(buffer, 2, &ok), 0xFFFF);
    EXPECT_TRUE(ok);
}

TEST(PowerTagDataUtils, EnergyWattHoursToKiloWattHours)
{
    QByteArray buffer = PowerTagDataUtils::registersToByteArray(FakeGatewaySession::int64Registers(5000));
    bool ok = false;
    EXPECT_DOUBLE_EQ(PowerTagDataUtils::decodeScaledInt64(buffer, 0, 1000, &ok), 5.0);
    EXPECT_TRUE(ok);

    buffer = PowerTagDataUtils::registersToByteArray(FakeGatewaySession::int64Registers(12345678901LL));
    EXPECT_DOUBLE_EQ(PowerTagDataUtils::decodeScaledInt64(buffer, 0, 1000, &ok), 12345678.901);
}

TEST(PowerTagDataUtils, ScaledInt64IsSigned)
{
    QByteArray buffer = PowerTagDataUtils::registersToByteArray(FakeGatewaySession::int64Registers(-2500));
    bool ok = false;
    EXPECT_DOUBLE_EQ(PowerTagDataUtils::decodeScaledInt64(buffer, 0, 1000, &ok), -2.5);
    EXPECT_TRUE(ok);
}

TEST(PowerTagDataUtils, ZeroDivisorIsNotOk)
{
    QByteArray buffer = PowerTagDataUtils::registersToByteArray(FakeGatewaySession::int64Registers(5000));
    bool ok = true;
    EXPECT_EQ(PowerTagDataUtils::decodeScaledInt64(buffer, 0, 0, &ok), 0.0);
    EXPECT_FALSE(ok);
}

TEST(PowerTagDataUtils, FixedAsciiStopsAtTerminator)
{
    // "A9MEM1560" padded with zeros to 16 registers
    QByteArray raw("A9MEM1560");
    raw.append(QByteArray(32 - raw.size(), '\0'));
    EXPECT_EQ(PowerTagDataUtils::decodeFixedAscii(raw), QString("A9MEM1560"));

    QByteArray garbage("Kitchen\0XYZ", 11);
    EXPECT_EQ(PowerTagDataUtils::decodeFixedAscii(garbage), QString("Kitchen"));
}

TEST(PowerTagDataUtils, FixedAsciiIsTrimmed)
{
    EXPECT_EQ(PowerTagDataUtils::decodeFixedAscii(QByteArray("  Oven  ")), QString("Oven"));
    EXPECT_TRUE(PowerTagDataUtils::decodeFixedAscii(QByteArray(20, '\0')).isEmpty());
    EXPECT_TRUE(PowerTagDataUtils::decodeFixedAscii(QByteArray()).isEmpty());
}
