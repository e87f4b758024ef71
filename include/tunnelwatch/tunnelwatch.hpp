#pragma once

#include "types.hpp"
#include "registry.hpp"
#include "snapshot.hpp"
#include "scanner.hpp"
#include "engine.hpp"
#include "sink.hpp"
#include "monitor.hpp"
#include "state.hpp"
#include "config.hpp"
