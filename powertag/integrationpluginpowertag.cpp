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

#include "integrationpluginpowertag.h"
#include "plugininfo.h"
#include "powertagdiscovery.h"

#include <hardwaremanager.h>

#include <QPointer>

IntegrationPluginPowerTag::IntegrationPluginPowerTag()
{

}

void IntegrationPluginPowerTag::init()
{
    m_thingClassFamilies.insert(powerTagEnergyThingClassId, PowerTagModel::FamilyEnergy);
    m_thingClassFamilies.insert(heatTagThingClassId, PowerTagModel::FamilyHeatTag);
    m_thingClassFamilies.insert(powerTagControl2DIThingClassId, PowerTagModel::FamilyControl2DI);
    m_thingClassFamilies.insert(powerTagControlIOThingClassId, PowerTagModel::FamilyControlIO);

    // Discovery params
    m_discoveryAddressParamTypeIds.insert(powerTagEnergyThingClassId, powerTagEnergyDiscoveryAddressParamTypeId);
    m_discoveryAddressParamTypeIds.insert(heatTagThingClassId, heatTagDiscoveryAddressParamTypeId);
    m_discoveryAddressParamTypeIds.insert(powerTagControl2DIThingClassId, powerTagControl2DIDiscoveryAddressParamTypeId);
    m_discoveryAddressParamTypeIds.insert(powerTagControlIOThingClassId, powerTagControlIODiscoveryAddressParamTypeId);

    m_discoveryPortParamTypeIds.insert(powerTagEnergyThingClassId, powerTagEnergyDiscoveryPortParamTypeId);
    m_discoveryPortParamTypeIds.insert(heatTagThingClassId, heatTagDiscoveryPortParamTypeId);
    m_discoveryPortParamTypeIds.insert(powerTagControl2DIThingClassId, powerTagControl2DIDiscoveryPortParamTypeId);
    m_discoveryPortParamTypeIds.insert(powerTagControlIOThingClassId, powerTagControlIODiscoveryPortParamTypeId);

    // Thing params
    m_addressParamTypeIds.insert(powerTagEnergyThingClassId, powerTagEnergyThingAddressParamTypeId);
    m_addressParamTypeIds.insert(heatTagThingClassId, heatTagThingAddressParamTypeId);
    m_addressParamTypeIds.insert(powerTagControl2DIThingClassId, powerTagControl2DIThingAddressParamTypeId);
    m_addressParamTypeIds.insert(powerTagControlIOThingClassId, powerTagControlIOThingAddressParamTypeId);

    m_portParamTypeIds.insert(powerTagEnergyThingClassId, powerTagEnergyThingPortParamTypeId);
    m_portParamTypeIds.insert(heatTagThingClassId, heatTagThingPortParamTypeId);
    m_portParamTypeIds.insert(powerTagControl2DIThingClassId, powerTagControl2DIThingPortParamTypeId);
    m_portParamTypeIds.insert(powerTagControlIOThingClassId, powerTagControlIOThingPortParamTypeId);

    m_unitIdParamTypeIds.insert(powerTagEnergyThingClassId, powerTagEnergyThingUnitIdParamTypeId);
    m_unitIdParamTypeIds.insert(heatTagThingClassId, heatTagThingUnitIdParamTypeId);
    m_unitIdParamTypeIds.insert(powerTagControl2DIThingClassId, powerTagControl2DIThingUnitIdParamTypeId);
    m_unitIdParamTypeIds.insert(powerTagControlIOThingClassId, powerTagControlIOThingUnitIdParamTypeId);

    m_typeIdParamTypeIds.insert(powerTagEnergyThingClassId, powerTagEnergyThingTypeIdParamTypeId);
    m_typeIdParamTypeIds.insert(heatTagThingClassId, heatTagThingTypeIdParamTypeId);
    m_typeIdParamTypeIds.insert(powerTagControl2DIThingClassId, powerTagControl2DIThingTypeIdParamTypeId);
    m_typeIdParamTypeIds.insert(powerTagControlIOThingClassId, powerTagControlIOThingTypeIdParamTypeId);

    m_commercialReferenceParamTypeIds.insert(powerTagEnergyThingClassId, powerTagEnergyThingCommercialReferenceParamTypeId);
    m_commercialReferenceParamTypeIds.insert(heatTagThingClassId, heatTagThingCommercialReferenceParamTypeId);
    m_commercialReferenceParamTypeIds.insert(powerTagControl2DIThingClassId, powerTagControl2DIThingCommercialReferenceParamTypeId);
    m_commercialReferenceParamTypeIds.insert(powerTagControlIOThingClassId, powerTagControlIOThingCommercialReferenceParamTypeId);

    m_connectedStateTypeIds.insert(powerTagEnergyThingClassId, powerTagEnergyConnectedStateTypeId);
    m_connectedStateTypeIds.insert(heatTagThingClassId, heatTagConnectedStateTypeId);
    m_connectedStateTypeIds.insert(powerTagControl2DIThingClassId, powerTagControl2DIConnectedStateTypeId);
    m_connectedStateTypeIds.insert(powerTagControlIOThingClassId, powerTagControlIOConnectedStateTypeId);

    connect(this, &IntegrationPlugin::configValueChanged, this, &IntegrationPluginPowerTag::onPluginConfigurationChanged);
}

void IntegrationPluginPowerTag::discoverThings(ThingDiscoveryInfo *info)
{
    ThingClassId thingClassId = info->thingClassId();
    if (!m_thingClassFamilies.contains(thingClassId)) {
        info->finish(Thing::ThingErrorThingClassNotFound, QT_TR_NOOP("Unknown thing class ID."));
        return;
    }

    GatewayEndpoint endpoint;
    endpoint.address = info->params().paramValue(m_discoveryAddressParamTypeIds.value(thingClassId)).toString().trimmed();
    endpoint.port = info->params().paramValue(m_discoveryPortParamTypeIds.value(thingClassId)).toUInt();
    if (endpoint.address.isEmpty()) {
        info->finish(Thing::ThingErrorInvalidParameter, QT_TR_NOOP("Please enter the address of the gateway."));
        return;
    }

    qCDebug(dcPowerTag()) << "Starting discovery on" << endpoint;

    // The discovery blocks in local event loops, the info may get deleted in the meantime
    QPointer<ThingDiscoveryInfo> infoGuard(info);

    PowerTagTcpSession session;
    PowerTagModbusSession::ConnectionError connectionError = session.connectDevice(endpoint, configValue(powerTagPluginConnectTimeoutParamTypeId).toInt());
    if (infoGuard.isNull()) {
        qCDebug(dcPowerTag()) << "Discovery info has been destroyed while connecting to" << endpoint;
        return;
    }

    if (connectionError != PowerTagModbusSession::ConnectionErrorNoError) {
        qCWarning(dcPowerTag()) << "Could not connect to the gateway" << endpoint << connectionError;
        info->finish(Thing::ThingErrorHardwareNotAvailable, QString("Cannot connect to the gateway at %1:%2.").arg(endpoint.address).arg(endpoint.port));
        return;
    }

    PowerTagDiscovery::Settings settings;
    settings.readTimeout = configValue(powerTagPluginReadTimeoutParamTypeId).toInt();
    settings.discoveryTimeout = configValue(powerTagPluginDiscoveryTimeoutParamTypeId).toInt() * 1000;

    PowerTagDiscovery discovery(m_modelRegistry, &session, settings);
    discovery.startDiscovery();
    session.close();

    if (infoGuard.isNull()) {
        qCDebug(dcPowerTag()) << "Discovery info has been destroyed while scanning" << endpoint;
        return;
    }

    PowerTagModel::Family family = m_thingClassFamilies.value(thingClassId);
    foreach (const PowerTagDiscovery::Result &result, discovery.discoveryResults()) {
        if (result.model.family() != family)
            continue;

        QString title = result.name;
        if (title.isEmpty())
            title = QString("%1 (%2)").arg(result.model.name()).arg(result.unitId);

        QString description = QString("%1:%2 unit id %3").arg(endpoint.address).arg(endpoint.port).arg(result.unitId);
        ThingDescriptor descriptor(thingClassId, title, description);
        qCInfo(dcPowerTag()) << "Discovered:" << descriptor.title() << descriptor.description();

        // Keep the ThingId of devices already added, required for reconfiguring them
        Things existingThings = myThings().filterByThingClassId(thingClassId)
                .filterByParam(m_addressParamTypeIds.value(thingClassId), endpoint.address)
                .filterByParam(m_portParamTypeIds.value(thingClassId), endpoint.port)
                .filterByParam(m_unitIdParamTypeIds.value(thingClassId), result.unitId);
        if (!existingThings.isEmpty())
            descriptor.setThingId(existingThings.first()->id());

        ParamList params;
        params << Param(m_addressParamTypeIds.value(thingClassId), endpoint.address);
        params << Param(m_portParamTypeIds.value(thingClassId), endpoint.port);
        params << Param(m_unitIdParamTypeIds.value(thingClassId), result.unitId);
        params << Param(m_typeIdParamTypeIds.value(thingClassId), result.typeId);
        params << Param(m_commercialReferenceParamTypeIds.value(thingClassId), result.model.commercialReference());
        descriptor.setParams(params);
        info->addThingDescriptor(descriptor);
    }

    info->finish(Thing::ThingErrorNoError);
}

void IntegrationPluginPowerTag::setupThing(ThingSetupInfo *info)
{
    Thing *thing = info->thing();
    if (!m_thingClassFamilies.contains(thing->thingClassId())) {
        info->finish(Thing::ThingErrorThingClassNotFound, QT_TR_NOOP("Unknown thing class ID."));
        return;
    }

    qCDebug(dcPowerTag()) << "Setup" << thing << thing->params();

    // Handle reconfigure
    if (m_sessions.contains(thing)) {
        qCDebug(dcPowerTag()) << "Already have a gateway session for this thing. Cleaning up the old one.";
        cleanupThing(thing);
    }

    uint unitId = thing->paramValue(m_unitIdParamTypeIds.value(thing->thingClassId())).toUInt();
    if (unitId < 1 || unitId > 247) {
        qCWarning(dcPowerTag()) << "Invalid unit id" << unitId << "for" << thing;
        info->finish(Thing::ThingErrorInvalidParameter, QT_TR_NOOP("The Modbus unit ID must be between 1 and 247."));
        return;
    }

    PowerTagModel model = modelForThing(thing);
    if (!model.isValid() || model.family() != m_thingClassFamilies.value(thing->thingClassId())) {
        qCWarning(dcPowerTag()) << "The device type of" << thing << "is not supported by this thing class" << model;
        info->finish(Thing::ThingErrorInvalidParameter, QT_TR_NOOP("The device type is not supported. Please run the discovery again."));
        return;
    }

    // The connection gets established on the first refresh
    PowerTagTcpSession *session = new PowerTagTcpSession(this);
    m_sessions.insert(thing, session);
    setupPoller(thing, session, model);

    info->finish(Thing::ThingErrorNoError);
}

void IntegrationPluginPowerTag::postSetupThing(Thing *thing)
{
    qCDebug(dcPowerTag()) << "Post setup thing" << thing->name();
    startRefreshTimer();
    refreshThing(thing);
}

void IntegrationPluginPowerTag::thingRemoved(Thing *thing)
{
    qCDebug(dcPowerTag()) << "Thing removed" << thing->name();
    cleanupThing(thing);

    if (myThings().isEmpty() && m_refreshTimer) {
        hardwareManager()->pluginTimerManager()->unregisterTimer(m_refreshTimer);
        m_refreshTimer = nullptr;
    }
}

void IntegrationPluginPowerTag::executeAction(ThingActionInfo *info)
{
    Thing *thing = info->thing();
    Action action = info->action();

    if (thing->thingClassId() != powerTagControlIOThingClassId || action.actionTypeId() != powerTagControlIOPowerActionTypeId) {
        info->finish(Thing::ThingErrorActionTypeNotFound);
        return;
    }

    PowerTagPoller *poller = m_pollers.value(thing);
    if (!poller || !poller->reachable()) {
        qCWarning(dcPowerTag()) << "Could not execute action because the device is not reachable" << thing;
        info->finish(Thing::ThingErrorHardwareNotAvailable);
        return;
    }

    bool power = action.param(powerTagControlIOPowerActionPowerParamTypeId).value().toBool();
    qCDebug(dcPowerTag()) << "Switching output of" << thing->name() << (power ? "on" : "off");
    if (!poller->setOutput(power)) {
        info->finish(Thing::ThingErrorHardwareFailure);
        return;
    }

    thing->setStateValue(powerTagControlIOPowerStateTypeId, power);
    info->finish(Thing::ThingErrorNoError);
}

GatewayEndpoint IntegrationPluginPowerTag::gatewayEndpoint(Thing *thing) const
{
    GatewayEndpoint endpoint;
    endpoint.address = thing->paramValue(m_addressParamTypeIds.value(thing->thingClassId())).toString();
    endpoint.port = thing->paramValue(m_portParamTypeIds.value(thing->thingClassId())).toUInt();
    return endpoint;
}

PowerTagModel IntegrationPluginPowerTag::modelForThing(Thing *thing) const
{
    quint16 typeId = thing->paramValue(m_typeIdParamTypeIds.value(thing->thingClassId())).toUInt();
    PowerTagModel model = m_modelRegistry.lookupByTypeId(typeId);
    if (model.isValid())
        return model;

    // Manually added things may only know the commercial reference
    QString reference = thing->paramValue(m_commercialReferenceParamTypeIds.value(thing->thingClassId())).toString();
    return m_modelRegistry.lookupByCommercialReference(reference);
}

void IntegrationPluginPowerTag::setupPoller(Thing *thing, PowerTagTcpSession *session, const PowerTagModel &model)
{
    quint8 unitId = static_cast<quint8>(thing->paramValue(m_unitIdParamTypeIds.value(thing->thingClassId())).toUInt());
    PowerTagPoller *poller = new PowerTagPoller(session, unitId, model, this);
    poller->setReadTimeout(configValue(powerTagPluginReadTimeoutParamTypeId).toInt());
    m_pollers.insert(thing, poller);

    StateTypeId connectedStateTypeId = m_connectedStateTypeIds.value(thing->thingClassId());
    connect(poller, &PowerTagPoller::reachableChanged, thing, [thing, connectedStateTypeId](bool reachable) {
        qCDebug(dcPowerTag()) << "Reachable state of" << thing->name() << "changed to" << reachable;
        thing->setStateValue(connectedStateTypeId, reachable);
        if (!reachable && thing->thingClassId() == powerTagEnergyThingClassId) {
            thing->setStateValue(powerTagEnergyCurrentPowerStateTypeId, 0);
        }
    });

    // A failed poll may leave stale replies on the connection, start over on the next refresh
    connect(poller, &PowerTagPoller::pollFailed, session, &PowerTagTcpSession::close);

    switch (model.family()) {
    case PowerTagModel::FamilyEnergy:
        poller->setVoltageMode(PowerTagModel::voltageModeFromString(thing->setting(powerTagEnergySettingsVoltageModeParamTypeId).toString()));
        connect(thing, &Thing::settingChanged, poller, [poller](const ParamTypeId &paramTypeId, const QVariant &value) {
            if (paramTypeId == powerTagEnergySettingsVoltageModeParamTypeId) {
                qCDebug(dcPowerTag()) << "Voltage mode of unit id" << poller->unitId() << "changed to" << value.toString();
                poller->setVoltageMode(PowerTagModel::voltageModeFromString(value.toString()));
            }
        });

        connect(poller, &PowerTagPoller::energyPollFinished, thing, [thing](const EnergyPollResult &result) {
            thing->setStateValue(powerTagEnergyCurrentPhaseAStateTypeId, result.currentL1);
            thing->setStateValue(powerTagEnergyCurrentPhaseBStateTypeId, result.currentL2);
            thing->setStateValue(powerTagEnergyCurrentPhaseCStateTypeId, result.currentL3);
            thing->setStateValue(powerTagEnergyVoltagePhaseAStateTypeId, result.voltagePh1);
            thing->setStateValue(powerTagEnergyVoltagePhaseBStateTypeId, result.voltagePh2);
            thing->setStateValue(powerTagEnergyVoltagePhaseCStateTypeId, result.voltagePh3);
            thing->setStateValue(powerTagEnergyCurrentPowerPhaseAStateTypeId, result.powerL1);
            thing->setStateValue(powerTagEnergyCurrentPowerPhaseBStateTypeId, result.powerL2);
            thing->setStateValue(powerTagEnergyCurrentPowerPhaseCStateTypeId, result.powerL3);
            thing->setStateValue(powerTagEnergyCurrentPowerStateTypeId, result.totalPower);
            thing->setStateValue(powerTagEnergyPowerFactorStateTypeId, result.powerFactor);
            thing->setStateValue(powerTagEnergyFrequencyStateTypeId, result.frequency);
            thing->setStateValue(powerTagEnergyTemperatureStateTypeId, result.temperature);
            thing->setStateValue(powerTagEnergyTotalEnergyConsumedStateTypeId, result.totalEnergy);
        });
        break;
    case PowerTagModel::FamilyHeatTag:
        connect(poller, &PowerTagPoller::heatTagPollFinished, thing, [thing](const HeatTagPollResult &result) {
            thing->setStateValue(heatTagTemperatureStateTypeId, result.temperature);
            thing->setStateValue(heatTagHumidityStateTypeId, result.humidity);
            thing->setStateValue(heatTagAlarmLevelStateTypeId, result.alarmLevel);
        });
        break;
    case PowerTagModel::FamilyControl2DI:
        connect(poller, &PowerTagPoller::control2DIPollFinished, thing, [thing](const Control2DIPollResult &result) {
            thing->setStateValue(powerTagControl2DIInput1StateTypeId, result.di1Status);
            thing->setStateValue(powerTagControl2DIInput2StateTypeId, result.di2Status);
        });
        break;
    case PowerTagModel::FamilyControlIO:
        connect(poller, &PowerTagPoller::controlIOPollFinished, thing, [thing](const ControlIOPollResult &result) {
            thing->setStateValue(powerTagControlIOInput1StateTypeId, result.di1Status);
            thing->setStateValue(powerTagControlIOPowerStateTypeId, result.outputStatus);
        });
        break;
    case PowerTagModel::FamilyUnknown:
        break;
    }
}

void IntegrationPluginPowerTag::cleanupThing(Thing *thing)
{
    if (m_pollers.contains(thing)) {
        m_pollers.take(thing)->deleteLater();
    }

    if (m_sessions.contains(thing)) {
        PowerTagTcpSession *session = m_sessions.take(thing);
        session->close();
        session->deleteLater();
    }
}

void IntegrationPluginPowerTag::startRefreshTimer()
{
    if (m_refreshTimer)
        return;

    int refreshTime = configValue(powerTagPluginUpdateIntervalParamTypeId).toInt();
    qCDebug(dcPowerTag()) << "Starting refresh timer with an interval of" << refreshTime << "s";
    m_refreshTimer = hardwareManager()->pluginTimerManager()->registerTimer(refreshTime);
    connect(m_refreshTimer, &PluginTimer::timeout, this, &IntegrationPluginPowerTag::onRefreshTimer);
}

void IntegrationPluginPowerTag::refreshThing(Thing *thing)
{
    PowerTagTcpSession *session = m_sessions.value(thing);
    PowerTagPoller *poller = m_pollers.value(thing);
    if (!session || !poller)
        return;

    // Connecting and polling wait in a local event loop, a timer tick may arrive in the meantime
    if (session->busy() || poller->updateInProgress()) {
        qCDebug(dcPowerTag()) << "Previous refresh of" << thing->name() << "still in progress, skipping this cycle";
        return;
    }

    if (!session->connected()) {
        GatewayEndpoint endpoint = gatewayEndpoint(thing);
        qCDebug(dcPowerTag()) << "Connecting" << thing->name() << "to" << endpoint;
        PowerTagModbusSession::ConnectionError connectionError = session->connectDevice(endpoint, configValue(powerTagPluginConnectTimeoutParamTypeId).toInt());

        // The thing may have been removed while connecting
        if (m_pollers.value(thing) != poller)
            return;

        if (connectionError != PowerTagModbusSession::ConnectionErrorNoError) {
            qCWarning(dcPowerTag()) << "Could not connect" << thing->name() << "to" << endpoint << connectionError;
            poller->markUnreachable();
            return;
        }
    }

    poller->update();
}

void IntegrationPluginPowerTag::onRefreshTimer()
{
    if (m_refreshInProgress) {
        qCDebug(dcPowerTag()) << "Previous refresh cycle still running, skipping this one";
        return;
    }

    m_refreshInProgress = true;
    foreach (Thing *thing, m_pollers.keys()) {
        // Removed during a previous refresh
        if (!m_pollers.contains(thing))
            continue;

        refreshThing(thing);
    }
    m_refreshInProgress = false;
}

void IntegrationPluginPowerTag::onPluginConfigurationChanged(const ParamTypeId &paramTypeId, const QVariant &value)
{
    if (paramTypeId == powerTagPluginUpdateIntervalParamTypeId) {
        qCDebug(dcPowerTag()) << "Update interval has changed" << value.toInt() << "[s]";
        if (m_refreshTimer) {
            m_refreshTimer->stop();
            hardwareManager()->pluginTimerManager()->unregisterTimer(m_refreshTimer);
            m_refreshTimer = nullptr;
            startRefreshTimer();
            m_refreshTimer->start();
        }
    } else if (paramTypeId == powerTagPluginReadTimeoutParamTypeId) {
        qCDebug(dcPowerTag()) << "Updating request timeout" << value.toInt() << "[ms]";
        foreach (PowerTagPoller *poller, m_pollers) {
            poller->setReadTimeout(value.toInt());
        }
    } else if (paramTypeId == powerTagPluginConnectTimeoutParamTypeId || paramTypeId == powerTagPluginDiscoveryTimeoutParamTypeId) {
        // Read on use
        qCDebug(dcPowerTag()) << "Plugin configuration changed" << paramTypeId << value;
    } else {
        qCWarning(dcPowerTag()) << "Unknown plugin configuration" << paramTypeId << "Value" << value;
    }
}
