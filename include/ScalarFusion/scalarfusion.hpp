#pragma once

#include "annotated.hpp"
#include "capabilities.hpp"
#include "conversion.hpp"
#include "error_formatting.hpp"
#include "errors.hpp"
#include "number.hpp"
#include "options.hpp"
#include "raw_value.hpp"
#include "text.hpp"
#include "value.hpp"
