//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

#define REGEN_VERSION_MAJOR 0
#define REGEN_VERSION_MINOR 1
#define REGEN_VERSION_PATCH 0
#define REGEN_VERSION_STRING "0.1.0"

#include "profiles.hh"
#include "model.hh"
#include "markers.hh"
#include "manifest.hh"
#include "generator.hh"
#include "dependencies.hh"
#include "rewriter.hh"
#include "session.hh"
