#pragma once

#include "jsonmodel/model/field.hpp"
#include "jsonmodel/model/field_set.hpp"
#include "jsonmodel/model/field_value.hpp"
#include "jsonmodel/model/json_model.hpp"
#include "jsonmodel/model/macros.hpp"
#include "jsonmodel/model/model_exception.hpp"
#include "jsonmodel/model/model_field.hpp"
#include "jsonmodel/model/model_registry.hpp"
