#pragma once

// Resource resolution - Aggregate Header
// Include this for full locus functionality

#include "locus/error.hpp"
#include "locus/url.hpp"
#include "locus/resource.hpp"
#include "locus/abstract_resource.hpp"
#include "locus/context_resource.hpp"
#include "locus/class_path.hpp"
#include "locus/protocol_resolver.hpp"
#include "locus/loader.hpp"
#include "locus/file_system_loader.hpp"
#include "locus/config.hpp"

// Resource implementations
#include "locus/resources/file_system.hpp"
#include "locus/resources/class_path.hpp"
#include "locus/resources/url.hpp"
#include "locus/resources/stream.hpp"
#include "locus/resources/vfs.hpp"
