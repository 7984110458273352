#pragma once

#include <string>

#include "metrics/metric_record.h"

namespace Benchkit {

/**
 * Escapes a value for interpolation: &, <, >, " and ' become HTML entities
 * and control characters become spaces.
 */
std::string EscapeLabelValue(const std::string& value);

/**
 * Renders a label template against a context.
 *
 * Placeholders have the form {{ key }}; whitespace inside the braces is
 * ignored. Text outside placeholders is copied verbatim and substituted
 * values are never re-scanned.
 *
 * @throws TemplateError on an undefined key, an empty placeholder or a
 *         missing closing "}}"
 */
std::string RenderLabel(const std::string& label_template, const Context& ctx);

} // namespace Benchkit
