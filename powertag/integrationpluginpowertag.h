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

#ifndef INTEGRATIONPLUGINPOWERTAG_H
#define INTEGRATIONPLUGINPOWERTAG_H

#include <plugintimer.h>
#include <integrations/integrationplugin.h>

#include "extern-plugininfo.h"

#include "powertagmodelregistry.h"
#include "powertagtcpsession.h"
#include "powertagpoller.h"

class IntegrationPluginPowerTag: public IntegrationPlugin
{
    Q_OBJECT

    Q_PLUGIN_METADATA(IID "io.nymea.IntegrationPlugin" FILE "integrationpluginpowertag.json")
    Q_INTERFACES(IntegrationPlugin)

public:
    explicit IntegrationPluginPowerTag();

    void init() override;
    void discoverThings(ThingDiscoveryInfo *info) override;
    void setupThing(ThingSetupInfo *info) override;
    void postSetupThing(Thing *thing) override;
    void thingRemoved(Thing *thing) override;
    void executeAction(ThingActionInfo *info) override;

private:
    PowerTagModelRegistry m_modelRegistry;
    PluginTimer *m_refreshTimer = nullptr;
    bool m_refreshInProgress = false;

    QHash<Thing *, PowerTagTcpSession *> m_sessions;
    QHash<Thing *, PowerTagPoller *> m_pollers;

    QHash<ThingClassId, PowerTagModel::Family> m_thingClassFamilies;
    QHash<ThingClassId, ParamTypeId> m_discoveryAddressParamTypeIds;
    QHash<ThingClassId, ParamTypeId> m_discoveryPortParamTypeIds;
    QHash<ThingClassId, ParamTypeId> m_addressParamTypeIds;
    QHash<ThingClassId, ParamTypeId> m_portParamTypeIds;
    QHash<ThingClassId, ParamTypeId> m_unitIdParamTypeIds;
    QHash<ThingClassId, ParamTypeId> m_typeIdParamTypeIds;
    QHash<ThingClassId, ParamTypeId> m_commercialReferenceParamTypeIds;
    QHash<ThingClassId, StateTypeId> m_connectedStateTypeIds;

    GatewayEndpoint gatewayEndpoint(Thing *thing) const;
    PowerTagModel modelForThing(Thing *thing) const;
    void setupPoller(Thing *thing, PowerTagTcpSession *session, const PowerTagModel &model);
    void cleanupThing(Thing *thing);
    void startRefreshTimer();
    void refreshThing(Thing *thing);

private slots:
    void onRefreshTimer();
    void onPluginConfigurationChanged(const ParamTypeId &paramTypeId, const QVariant &value);
};

#endif // INTEGRATIONPLUGINPOWERTAG_H
