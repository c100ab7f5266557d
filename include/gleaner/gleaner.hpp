#pragma once

/** \file gleaner.hpp
 *  \brief Umbrella header for the retrieval library.
 */

#include "gleaner/chunker.hpp"
#include "gleaner/config.hpp"
#include "gleaner/embedder.hpp"
#include "gleaner/error.hpp"
#include "gleaner/filter_expr.hpp"
#include "gleaner/index_store.hpp"
#include "gleaner/ingestion.hpp"
#include "gleaner/logging.hpp"
#include "gleaner/retriever.hpp"
#include "gleaner/types.hpp"
