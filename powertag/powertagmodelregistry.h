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

#ifndef POWERTAGMODELREGISTRY_H
#define POWERTAGMODELREGISTRY_H

#include <QDebug>
#include <QHash>
#include <QList>
#include <QString>

class PowerTagModel
{
public:
    enum Family {
        FamilyUnknown,
        FamilyEnergy,
        FamilyHeatTag,
        FamilyControl2DI,
        FamilyControlIO
    };

    enum VoltageMode {
        VoltageModeLineToNeutral,
        VoltageModeLineToLine
    };

    enum VoltageModeSupport {
        VoltageModeSupportNone,
        VoltageModeSupportLineToNeutral,
        VoltageModeSupportLineToLine,
        VoltageModeSupportBoth
    };

    PowerTagModel() = default;
    PowerTagModel(quint16 typeId, const QString &commercialReference, const QString &name, Family family,
                  int phaseCount, VoltageModeSupport voltageModeSupport);

    bool isValid() const;

    quint16 typeId() const;
    QString commercialReference() const;
    QString name() const;
    Family family() const;
    int phaseCount() const;
    VoltageModeSupport voltageModeSupport() const;

    bool supportsVoltageMode(VoltageMode voltageMode) const;

    static QString familyToString(Family family);
    static QString voltageModeToString(VoltageMode voltageMode);
    // Accepts "L-N" and "L-L", anything else falls back to line to neutral
    static VoltageMode voltageModeFromString(const QString &voltageMode);

private:
    quint16 m_typeId = 0;
    QString m_commercialReference;
    QString m_name;
    Family m_family = FamilyUnknown;
    int m_phaseCount = 0;
    VoltageModeSupport m_voltageModeSupport = VoltageModeSupportNone;
};

QDebug operator<<(QDebug debug, const PowerTagModel &model);

// Read only after construction. Create one instance and hand it out by const reference.
class PowerTagModelRegistry
{
public:
    PowerTagModelRegistry();

    PowerTagModel lookupByTypeId(quint16 typeId) const;
    PowerTagModel lookupByCommercialReference(const QString &reference) const;

    QList<PowerTagModel> models() const;

private:
    QHash<quint16, PowerTagModel> m_modelsByTypeId;
    QHash<QString, PowerTagModel> m_modelsByReference;

    void addModel(const PowerTagModel &model);
};

#endif // POWERTAGMODELREGISTRY_H
