/***
 * Name: jflow::render::DiagramResult
 * Purpose: Output of one render: flowchart text and external receiver names.
 */
#pragma once

#include <string>
#include <vector>

namespace jflow {
namespace render {

struct DiagramResult {
  std::string diagram_text;
  std::vector<std::string> external_services;  // first-seen order, no duplicates
};

}  // namespace render
}  // namespace jflow
