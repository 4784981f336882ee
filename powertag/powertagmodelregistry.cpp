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

#include "powertagmodelregistry.h"

PowerTagModel::PowerTagModel(quint16 typeId, const QString &commercialReference, const QString &name, Family family,
                             int phaseCount, VoltageModeSupport voltageModeSupport) :
    m_typeId(typeId),
    m_commercialReference(commercialReference),
    m_name(name),
    m_family(family),
    m_phaseCount(phaseCount),
    m_voltageModeSupport(voltageModeSupport)
{

}

bool PowerTagModel::isValid() const
{
    return m_family != FamilyUnknown && m_typeId != 0;
}

quint16 PowerTagModel::typeId() const
{
    return m_typeId;
}

QString PowerTagModel::commercialReference() const
{
    return m_commercialReference;
}

QString PowerTagModel::name() const
{
    return m_name;
}

PowerTagModel::Family PowerTagModel::family() const
{
    return m_family;
}

int PowerTagModel::phaseCount() const
{
    return m_phaseCount;
}

PowerTagModel::VoltageModeSupport PowerTagModel::voltageModeSupport() const
{
    return m_voltageModeSupport;
}

bool PowerTagModel::supportsVoltageMode(VoltageMode voltageMode) const
{
    switch (m_voltageModeSupport) {
    case VoltageModeSupportBoth:
        return true;
    case VoltageModeSupportLineToNeutral:
        return voltageMode == VoltageModeLineToNeutral;
    case VoltageModeSupportLineToLine:
        return voltageMode == VoltageModeLineToLine;
    case VoltageModeSupportNone:
        break;
    }
    return false;
}

QString PowerTagModel::familyToString(Family family)
{
    switch (family) {
    case FamilyEnergy:
        return QStringLiteral("Energy");
    case FamilyHeatTag:
        return QStringLiteral("HeatTag");
    case FamilyControl2DI:
        return QStringLiteral("Control2DI");
    case FamilyControlIO:
        return QStringLiteral("ControlIO");
    case FamilyUnknown:
        break;
    }
    return QStringLiteral("Unknown");
}

QString PowerTagModel::voltageModeToString(VoltageMode voltageMode)
{
    return voltageMode == VoltageModeLineToLine ? QStringLiteral("L-L") : QStringLiteral("L-N");
}

PowerTagModel::VoltageMode PowerTagModel::voltageModeFromString(const QString &voltageMode)
{
    if (voltageMode.trimmed().compare(QStringLiteral("L-L"), Qt::CaseInsensitive) == 0)
        return VoltageModeLineToLine;

    return VoltageModeLineToNeutral;
}

QDebug operator<<(QDebug debug, const PowerTagModel &model)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "PowerTagModel(" << model.commercialReference() << ", " << model.name()
                    << ", type: " << model.typeId()
                    << ", family: " << PowerTagModel::familyToString(model.family())
                    << ", phases: " << model.phaseCount() << ")";
    return debug;
}


PowerTagModelRegistry::PowerTagModelRegistry()
{
    // Wireless device type codes as reported by the Smartlink / Panel Server gateway
    // in the device type register 31024 of each wireless unit. The range scan only
    // knows devices listed here, codes missing from this table are logged by the
    // discovery at info level with their unit id so the entry can be added.
    // PowerTag M63
    addModel(PowerTagModel(41, "A9MEM1520", "PowerTag M63 1P", PowerTagModel::FamilyEnergy, 1, PowerTagModel::VoltageModeSupportLineToNeutral));
    addModel(PowerTagModel(42, "A9MEM1521", "PowerTag M63 1P+N Top", PowerTagModel::FamilyEnergy, 1, PowerTagModel::VoltageModeSupportLineToNeutral));
    addModel(PowerTagModel(43, "A9MEM1522", "PowerTag M63 1P+N Bottom", PowerTagModel::FamilyEnergy, 1, PowerTagModel::VoltageModeSupportLineToNeutral));
    addModel(PowerTagModel(44, "A9MEM1540", "PowerTag M63 3P", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportLineToLine));
    addModel(PowerTagModel(45, "A9MEM1541", "PowerTag M63 3P+N Top", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportBoth));
    addModel(PowerTagModel(46, "A9MEM1542", "PowerTag M63 3P+N Bottom", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportBoth));

    // PowerTag F63 / P63
    addModel(PowerTagModel(81, "A9MEM1560", "PowerTag F63 1P+N", PowerTagModel::FamilyEnergy, 1, PowerTagModel::VoltageModeSupportLineToNeutral));
    addModel(PowerTagModel(82, "A9MEM1561", "PowerTag P63 1P+N Top", PowerTagModel::FamilyEnergy, 1, PowerTagModel::VoltageModeSupportLineToNeutral));
    addModel(PowerTagModel(83, "A9MEM1562", "PowerTag P63 1P+N Bottom", PowerTagModel::FamilyEnergy, 1, PowerTagModel::VoltageModeSupportLineToNeutral));
    addModel(PowerTagModel(84, "A9MEM1563", "PowerTag P63 1P+N Bottom 110V", PowerTagModel::FamilyEnergy, 1, PowerTagModel::VoltageModeSupportLineToNeutral));
    addModel(PowerTagModel(85, "A9MEM1570", "PowerTag F63 3P+N", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportBoth));
    addModel(PowerTagModel(86, "A9MEM1571", "PowerTag P63 3P+N Top", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportBoth));
    addModel(PowerTagModel(87, "A9MEM1572", "PowerTag P63 3P+N Bottom", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportBoth));

    // PowerTag M250 / M630
    addModel(PowerTagModel(92, "LV434020", "PowerTag M250 3P", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportLineToLine));
    addModel(PowerTagModel(93, "LV434021", "PowerTag M250 4P", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportBoth));
    addModel(PowerTagModel(94, "LV434022", "PowerTag M630 3P", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportLineToLine));
    addModel(PowerTagModel(95, "LV434023", "PowerTag M630 4P", PowerTagModel::FamilyEnergy, 3, PowerTagModel::VoltageModeSupportBoth));

    // Environmental sensor and control modules
    addModel(PowerTagModel(102, "SMT10020", "HeatTag", PowerTagModel::FamilyHeatTag, 1, PowerTagModel::VoltageModeSupportNone));
    addModel(PowerTagModel(103, "A9XMC2D3", "PowerTag C 2DI", PowerTagModel::FamilyControl2DI, 1, PowerTagModel::VoltageModeSupportNone));
    addModel(PowerTagModel(104, "A9XMC1D3", "PowerTag C IO", PowerTagModel::FamilyControlIO, 1, PowerTagModel::VoltageModeSupportNone));
}

PowerTagModel PowerTagModelRegistry::lookupByTypeId(quint16 typeId) const
{
    return m_modelsByTypeId.value(typeId);
}

PowerTagModel PowerTagModelRegistry::lookupByCommercialReference(const QString &reference) const
{
    const QString normalizedReference = reference.trimmed().toUpper();
    if (normalizedReference.isEmpty())
        return PowerTagModel();

    if (m_modelsByReference.contains(normalizedReference))
        return m_modelsByReference.value(normalizedReference);

    // Gateways may append a variant suffix, pick the longest known reference the string starts with
    PowerTagModel bestMatch;
    foreach (const PowerTagModel &model, m_modelsByReference) {
        if (!normalizedReference.startsWith(model.commercialReference()))
            continue;

        if (model.commercialReference().length() > bestMatch.commercialReference().length())
            bestMatch = model;
    }

    return bestMatch;
}

QList<PowerTagModel> PowerTagModelRegistry::models() const
{
    return m_modelsByTypeId.values();
}

void PowerTagModelRegistry::addModel(const PowerTagModel &model)
{
    m_modelsByTypeId.insert(model.typeId(), model);
    m_modelsByReference.insert(model.commercialReference().toUpper(), model);
}
