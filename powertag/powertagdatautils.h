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

#ifndef POWERTAGDATAUTILS_H
#define POWERTAGDATAUTILS_H

#include <QByteArray>
#include <QString>
#include <QVector>

// All PowerTag registers are big endian, the first register holds the most significant word.
class PowerTagDataUtils
{
public:
    static QByteArray registersToByteArray(const QVector<quint16> &registers);

    // Byte offsets into the buffer. On a short buffer ok is set to false and 0 is returned.
    static double decodeFloat32(const QByteArray &buffer, int offset, bool *ok = nullptr);
    static quint16 decodeUInt16(const QByteArray &buffer, int offset, bool *ok = nullptr);
    static double decodeScaledInt64(const QByteArray &buffer, int offset, double divisor, bool *ok = nullptr);

    // Zero terminated ASCII, surrounding whitespace removed
    static QString decodeFixedAscii(const QByteArray &buffer);

private:
    static bool checkSize(const QByteArray &buffer, int offset, int width, bool *ok);
};

#endif // POWERTAGDATAUTILS_H
