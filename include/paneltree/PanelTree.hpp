#pragma once

#include <paneltree/config/EngineConfig.hpp>
#include <paneltree/config/ParallelPhases.hpp>
#include <paneltree/context/Engine.hpp>
#include <paneltree/context/NodeContext.hpp>
#include <paneltree/context/UpdateScheduler.hpp>
#include <paneltree/core/Error.hpp>
#include <paneltree/core/Ids.hpp>
#include <paneltree/core/ZIndex.hpp>
#include <paneltree/info/InfoBuilder.hpp>
#include <paneltree/inspect/ListInspector.hpp>
#include <paneltree/layout/Units.hpp>
#include <paneltree/list/ChainList.hpp>
#include <paneltree/list/EditableList.hpp>
#include <paneltree/list/ListObserver.hpp>
#include <paneltree/list/MultiList.hpp>
#include <paneltree/list/NodeList.hpp>
#include <paneltree/list/PanelList.hpp>
#include <paneltree/list/SortingList.hpp>
#include <paneltree/list/VectorList.hpp>
#include <paneltree/node/Node.hpp>
#include <paneltree/node/WidgetNode.hpp>
#include <paneltree/render/FrameBuilder.hpp>
#include <paneltree/render/FrameUpdate.hpp>
#include <paneltree/render/FrameValue.hpp>
#include <paneltree/task/WorkerPool.hpp>
#include <paneltree/update/Updates.hpp>
