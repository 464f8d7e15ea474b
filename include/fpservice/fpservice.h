#pragma once

/**
 * @file fpservice.h
 * @brief Main header for the fingerprint session service
 *
 * Include this single header to access the session state machines,
 * lockout policy and per-user template registry.
 */

// Core types and utilities
#include "fpservice/core/types.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/Configuration.hpp"
#include "fpservice/core/exception.h"

// Template storage
#include "fpservice/storage/Template.hpp"
#include "fpservice/storage/TemplateRegistry.hpp"
#include "fpservice/storage/TemplateRegistryStore.hpp"

// Sessions
#include "fpservice/session/AuthenticateSession.hpp"
#include "fpservice/session/EnrollSession.hpp"
#include "fpservice/session/LockoutPolicy.hpp"
#include "fpservice/session/RemoveSession.hpp"

namespace fpservice {

inline core::Version getVersion() {
    return core::API_VERSION;
}

inline std::string getVersionString() {
    return core::API_VERSION.toString();
}

} // namespace fpservice
