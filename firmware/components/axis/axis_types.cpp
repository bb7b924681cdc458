/**
 * @file axis_types.cpp
 * @brief Axis type name conversion
 * @author TCMU Team
 * @date 2025
 */

#include "axis_types.h"

#include <cstring>

AxisType axis_type_from_string(const char* name)
{
    if (name == nullptr) {
        return AXIS_TYPE_NONE;
    }

    if (strcmp(name, "linear") == 0) {
        return AXIS_TYPE_LINEAR;
    }
    if (strcmp(name, "rotation") == 0) {
        return AXIS_TYPE_ROTATION;
    }
    if (strcmp(name, "auxiliary") == 0) {
        return AXIS_TYPE_AUXILIARY;
    }
    if (strcmp(name, "boolean") == 0) {
        return AXIS_TYPE_BOOLEAN;
    }

    return AXIS_TYPE_NONE;
}

const char* axis_type_to_string(AxisType type)
{
    switch (type) {
        case AXIS_TYPE_LINEAR:    return "linear";
        case AXIS_TYPE_ROTATION:  return "rotation";
        case AXIS_TYPE_AUXILIARY: return "auxiliary";
        case AXIS_TYPE_BOOLEAN:   return "boolean";
        default:                  return "none";
    }
}
