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

#include "powertagdatautils.h"
#include "loggingcategories.h"

#include <QtEndian>
#include <QDebug>

#include <cstring>

NYMEA_LOGGING_CATEGORY(dcPowerTagDataUtils, "PowerTagDataUtils")

QByteArray PowerTagDataUtils::registersToByteArray(const QVector<quint16> &registers)
{
    QByteArray buffer(registers.count() * 2, '\0');
    uchar *data = reinterpret_cast<uchar *>(buffer.data());
    for (int i = 0; i < registers.count(); i++) {
        qToBigEndian<quint16>(registers.at(i), data + i * 2);
    }
    return buffer;
}

double PowerTagDataUtils::decodeFloat32(const QByteArray &buffer, int offset, bool *ok)
{
    if (!checkSize(buffer, offset, 4, ok))
        return 0;

    quint32 rawValue = qFromBigEndian<quint32>(reinterpret_cast<const uchar *>(buffer.constData() + offset));
    float value = 0;
    std::memcpy(&value, &rawValue, sizeof(value));
    return static_cast<double>(value);
}

quint16 PowerTagDataUtils::decodeUInt16(const QByteArray &buffer, int offset, bool *ok)
{
    if (!checkSize(buffer, offset, 2, ok))
        return 0;

    return qFromBigEndian<quint16>(reinterpret_cast<const uchar *>(buffer.constData() + offset));
}

double PowerTagDataUtils::decodeScaledInt64(const QByteArray &buffer, int offset, double divisor, bool *ok)
{
    if (divisor == 0) {
        qCWarning(dcPowerTagDataUtils()) << "Cannot scale a 64 bit value with a divisor of 0";
        if (ok)
            *ok = false;

        return 0;
    }

    if (!checkSize(buffer, offset, 8, ok))
        return 0;

    quint64 rawValue = qFromBigEndian<quint64>(reinterpret_cast<const uchar *>(buffer.constData() + offset));
    return static_cast<double>(static_cast<qint64>(rawValue)) / divisor;
}

QString PowerTagDataUtils::decodeFixedAscii(const QByteArray &buffer)
{
    int length = buffer.indexOf('\0');
    if (length < 0)
        length = buffer.length();

    return QString::fromLatin1(buffer.constData(), length).trimmed();
}

bool PowerTagDataUtils::checkSize(const QByteArray &buffer, int offset, int width, bool *ok)
{
    if (offset < 0 || buffer.length() - offset < width) {
        qCWarning(dcPowerTagDataUtils()) << "Register buffer too short: need" << width << "bytes at offset" << offset << "but the buffer has" << buffer.length() << "bytes";
        if (ok)
            *ok = false;

        return false;
    }

    if (ok)
        *ok = true;

    return true;
}
