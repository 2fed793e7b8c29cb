#pragma once

#include "meshlink/log/logger.hpp"
#include "meshlink/core/session.hpp"
#include "meshlink/core/policy/json_loader.hpp"
