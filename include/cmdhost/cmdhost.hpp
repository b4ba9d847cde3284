#pragma once

/**
 * @file cmdhost.hpp
 * @brief Single include for applications built on cmdhost
 */

#include "cmdhost/types.hpp"
#include "cmdhost/flag.hpp"
#include "cmdhost/command.hpp"
#include "cmdhost/pipeline.hpp"
#include "cmdhost/lockable.hpp"
#include "cmdhost/help.hpp"
#include "cmdhost/bootstrap.hpp"
#include "cmdhost/config.hpp"
