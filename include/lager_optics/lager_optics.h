// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lager_optics.h
/// @brief Convenience header pulling in every optic, the law checker and the lager adapters.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/api.h>

#include <lager_optics/concepts.h>
#include <lager_optics/either.h>
#include <lager_optics/effect.h>
#include <lager_optics/monoid.h>
#include <lager_optics/optic_kind.h>

#include <lager_optics/fold.h>
#include <lager_optics/getter.h>
#include <lager_optics/setter.h>
#include <lager_optics/traversal.h>
#include <lager_optics/optional.h>
#include <lager_optics/lens.h>
#include <lager_optics/iso.h>
#include <lager_optics/prism.h>
#include <lager_optics/prisms.h>
#include <lager_optics/category.h>

#include <lager_optics/laws.h>
#include <lager_optics/lager_adapters.h>
