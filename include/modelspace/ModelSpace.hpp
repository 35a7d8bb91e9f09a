#pragma once

#include <modelspace/core/Error.hpp>
#include <modelspace/core/Options.hpp>
#include <modelspace/core/VideoState.hpp>
#include <modelspace/model/BestSession.hpp>
#include <modelspace/model/Entity.hpp>
#include <modelspace/model/EntityRegistry.hpp>
#include <modelspace/model/Event.hpp>
#include <modelspace/model/EventEmitter.hpp>
#include <modelspace/model/Payload.hpp>
#include <modelspace/model/Session.hpp>
#include <modelspace/model/Watcher.hpp>
#include <modelspace/payload/Unquote.hpp>
