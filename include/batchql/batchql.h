#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/batchql.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "batchql/batchql.h"
//  using namespace batchql;
//
//    • graphql::Graphql, graphql::Options, graphql::mount()
//    • graphql::Loaders, graphql::LoaderQuery, graphql::LoaderOptions
//    • graphql::Context, graphql::Deferred, graphql::FieldValue
//    • http::Server
//    • console::log(), info(), warn(), error(), debug()
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "console.h"
#include "errors.h"

#include "http.h"

#include "graphql.h"
