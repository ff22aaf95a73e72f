#pragma once

// Umbrella header: everything needed to describe, register and bind
// native classes.

#include "pn/binding.hpp"
#include "pn/class_info.hpp"
#include "pn/class_shell.hpp"
#include "pn/class_type.hpp"
#include "pn/config.hpp"
#include "pn/error.hpp"
#include "pn/error_logger.hpp"
#include "pn/function_description.hpp"
#include "pn/layout.hpp"
#include "pn/object.hpp"
#include "pn/type_registry.hpp"
