// stencil.hpp - Umbrella header for the template engine
#pragma once
#include "stencil/value.hpp"
#include "stencil/token.hpp"
#include "stencil/ast.hpp"
#include "stencil/context.hpp"
#include "stencil/errors.hpp"
#include "stencil/options.hpp"
#include "stencil/log.hpp"
#include "stencil/render.hpp"
#include "stencil/module.hpp"
#include "stencil/pipeline.hpp"
#include "stencil/validate.hpp"
#include "stencil/diagnostics_json.hpp"
#include "stencil/modules/image_module.hpp"
