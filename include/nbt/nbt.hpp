#pragma once

// Core library
#include "core.hpp"
#include "error.hpp"
#include "log.hpp"
#include "tag.hpp"

// Wire format
#include "byte_io.hpp"
#include "codec.hpp"
#include "compression.hpp"
#include "mutf8.hpp"

// Files
#include "document.hpp"
#include "options.hpp"
#include "region.hpp"
#include "vendor_header.hpp"

// Struct binding
#include "archive/archive.hpp"

// Parallelism
#include "parallel.hpp"

// Debug output
#include "pretty.hpp"
