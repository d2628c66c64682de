#pragma once

// Aggregator header for the pipeline's data model.
// Instead of including each individual header (e.g. docsage_core/types/chunk.hpp),
// users can simply do `#include "docsage_core/types.hpp"`.
//
#include "docsage_core/types/chunk.hpp"
#include "docsage_core/types/document.hpp"
#include "docsage_core/types/file.hpp"
#include "docsage_core/types/retrieval.hpp"
