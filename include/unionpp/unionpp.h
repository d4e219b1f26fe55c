#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/unionpp.h — Umbrella header for the input union engine
// ═══════════════════════════════════════════════════════════════════
//
//  #include "unionpp/unionpp.h"
//  using namespace unionpp;
//
//  This single include gives you everything:
//    • SchemaBuilder, Schema, InputObjectType, InputUnionType
//    • validate(), ResolutionPlan
//    • resolve(), Coercer, CoercedValue
//    • EngineOptions, console::info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "config.h"
#include "errors.h"

// Schema model
#include "type_ref.h"
#include "schema.h"
#include "scalars.h"

// Build time
#include "strategy.h"

// Per request
#include "coerced_value.h"
#include "resolver.h"
#include "coercion.h"
