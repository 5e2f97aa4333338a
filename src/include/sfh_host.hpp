#pragma once
/**
 * @file sfh_host.hpp
 * @brief Safeframe host umbrella header: base layer, config and all safeframe components.
 *
 * Embedders include this header, implement the interfaces in
 * safeframe/slot_element.hpp, and create one SessionRegistry and one
 * MessageRouter per page plus one HostSession per slot.
 */

#include "sfh_base.hpp"

#include "utils/host_config.hpp"
#include "utils/uid_utils.hpp"

#include "safeframe/geometry.hpp"
#include "safeframe/host_session.hpp"
#include "safeframe/message_codec.hpp"
#include "safeframe/message_router.hpp"
#include "safeframe/session_registry.hpp"
#include "safeframe/size_negotiator.hpp"
#include "safeframe/slot_element.hpp"
