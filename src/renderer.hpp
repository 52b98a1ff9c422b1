#pragma once
/*
 * Renderer
 *
 * Purpose: paint an ordered batch of draw commands into a CellBuffer.
 * Constraint: stateless; the batch is validated as a whole before any cell
 *             is touched, so a rejected batch leaves the destination as it was.
 */
#include <string>
#include <vector>
#include "cell_buffer.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "widgets.hpp"

struct DrawCommand {
  WidgetKind kind = WidgetKind::Clear;
  WidgetId handle = NULL_WIDGET_ID;
  Rect area;
};

enum class RenderResult { Ok, InvalidKind, InvalidHandle };

class Renderer {
public:
  RenderResult validate(const Registry& reg, const std::vector<DrawCommand>& cmds, std::string& err) const;
  // Fresh frame of width x height; `out` is replaced only when the result is Ok.
  RenderResult render(const Registry& reg, const std::vector<DrawCommand>& cmds, int width, int height,
                      CellBuffer& out, std::string& err) const;

private:
  void paint(const Registry& reg, const DrawCommand& cmd, CellBuffer& buf) const;
};
