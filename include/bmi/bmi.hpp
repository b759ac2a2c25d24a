#pragma once

#include "measurement.hpp"
#include "calculator.hpp"
#include "form.hpp"

/*
 * bmi – A header-only Body Mass Index calculator.
 *
 * Features:
 *  - calculate(height, weight) returning the display string, or
 *    "Invalid input values" when either input is not strictly positive.
 *  - Structured results, raw computation and WHO category classification
 *    for callers that need the number rather than the message.
 *  - A small Form view-model that turns two text fields into a result for
 *    the desktop front end.
 *  - Depends on fmt for formatting and nothing else beyond the standard
 *    library.
 */
