#pragma once

// Main include header for the configuration layer

#include "cfg_exception.hpp"
#include "config.hpp"
#include "config_node.hpp"
#include "deserializer.hpp"
#include "document_builder.hpp"
#include "ini_reader.hpp"
#include "section_registry.hpp"
