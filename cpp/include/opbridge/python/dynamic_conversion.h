#ifndef OPBRIDGE_PYTHON_DYNAMIC_CONVERSION_H
#define OPBRIDGE_PYTHON_DYNAMIC_CONVERSION_H

#include <opbridge/types/value/dynamic_value.h>

#include <nanobind/nanobind.h>

namespace nb = nanobind;

namespace opbridge::python {

    /**
     * Python object to DynamicValue: None, bool, int, float, str, dict (keys taken
     * as text), list and tuple. Anything else raises ConversionError.
     */
    [[nodiscard]] value::DynamicValue from_python(nb::handle obj);

    // References come back as dicts carrying ``$id`` and / or ``$ref``
    [[nodiscard]] nb::object to_python(const value::DynamicValue& value);

    [[nodiscard]] value::Mapping mapping_from_python(nb::handle obj);

}  // namespace opbridge::python

#endif  // OPBRIDGE_PYTHON_DYNAMIC_CONVERSION_H
