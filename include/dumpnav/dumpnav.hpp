#pragma once

/// Convenience umbrella header for the dumpnav library.

#include <dumpnav/core/value.hpp>
#include <dumpnav/loader/dump.hpp>
#include <dumpnav/model/registry.hpp>
#include <dumpnav/parser/coerce.hpp>
#include <dumpnav/parser/columns.hpp>
#include <dumpnav/parser/scanner.hpp>
#include <dumpnav/parser/tuples.hpp>
#include <dumpnav/view/table_view.hpp>
