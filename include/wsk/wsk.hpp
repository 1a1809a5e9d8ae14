#pragma once

/**
 * @file wsk.hpp
 * @brief Umbrella header for the wsk library
 */

#include "wsk/artifacts.hpp"
#include "wsk/environment.hpp"
#include "wsk/logging.hpp"
#include "wsk/manifest.hpp"
#include "wsk/orchestrator.hpp"
#include "wsk/package_graph.hpp"
#include "wsk/platform.hpp"
#include "wsk/result.hpp"
#include "wsk/runner.hpp"
#include "wsk/skill.hpp"
#include "wsk/skill_registry.hpp"
#include "wsk/subprocess.hpp"
#include "wsk/types.hpp"
#include "wsk/workspace.hpp"
#include "wsk/workspace_config.hpp"
