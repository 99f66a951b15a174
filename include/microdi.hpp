#pragma once

#include "microdi/export.hpp"
#include "microdi/fwd.hpp"
#include "microdi/type_kind.hpp"
#include "microdi/type_traits.hpp"
#include "microdi/descriptor.hpp"
#include "microdi/manifest.hpp"
#include "microdi/options.hpp"
#include "microdi/exceptions.hpp"
#include "microdi/container.hpp"
