/***
 * Name: jflow::render::WriteStyleClasses
 * Purpose: Trailing classDef block shared by every diagram.
 */
#include <ostream>

#include "jflow/render/diagram_renderer.h"

namespace jflow::render {

void WriteStyleClasses(std::ostream& out) {
  out << "  classDef public fill:#f9f,stroke:#333,stroke-width:2px;\n"
      << "  classDef internal fill:#e1f5fe,stroke:#01579b,stroke-width:1px;\n"
      << "  classDef external fill:#ffe0b2,stroke:#e65100,stroke-width:1px,stroke-dasharray: 5 5;\n"
      << "  classDef decision fill:#fff9c4,stroke:#fbc02d,stroke-width:1px,shape:rhombus;\n"
      << "  classDef loop fill:#e8f5e9,stroke:#2e7d32,stroke-width:1px;\n"
      << "  classDef endNode fill:#fce4ec,stroke:#c62828,stroke-width:2px;\n";
}

}  // namespace jflow::render
