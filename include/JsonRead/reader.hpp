#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "read_result.hpp"
#include "position.hpp"
#include "io.hpp"
#include "escape_tables.hpp"
#include "utf8.hpp"
#include "reference.hpp"
#include "source_concept.hpp"
#include "string_decoder.hpp"
#include "stream_source.hpp"
#include "slice_source.hpp"
#include "string_source.hpp"
#include "source_ref.hpp"
#include "string_sequence.hpp"
