#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "imgui.h"
#include "raylib.h"
#include "raymath.h"
#include "rlImGui.h"
#include "pontoon/core/configurator.hpp"

namespace {

using pontoon::core::Configurator;
using pontoon::core::ObjectId;
using pontoon::core::PontoonColor;
using pontoon::core::PontoonType;
using pontoon::core::Rotation;
using pontoon::core::ToolKind;

constexpr float kAxisLength = 2.0f;
constexpr float kTopbarHeight = 74.0f;

enum class CameraDragMode {
  kNone = 0,
  kOrbit = 1,
  kPan = 2,
  kDolly = 3,
};

struct ViewerUiState {
  pontoon::core::ToolSettings tool{};
  CameraDragMode camera_drag_mode = CameraDragMode::kNone;
  bool pointer_on_grid_view = false;
  Vector2 press_position{};
  bool press_pending = false;

  ObjectId inspected_id = pontoon::core::kInvalidObjectId;
  char checkpoint_label[64] = "checkpoint";
  int new_grid_width = 20;
  int new_grid_height = 20;
  int new_grid_levels = 3;
  int new_grid_min_level = 0;
  bool show_grid_lines = true;
  bool ui_unified_workspace = true;
  bool ui_show_workspace = true;
  float ui_workspace_width = 0.0f;
  std::vector<std::string> logs;
};

struct ViewerPersistentSettings {
  int window_width = 1280;
  int window_height = 720;
  bool ui_unified_workspace = true;
  bool ui_show_workspace = true;
  float ui_workspace_width = 420.0f;
  bool show_grid_lines = true;
};

constexpr const char* kViewerSettingsFile = "pontoon_viewer.ini";

bool parse_bool(std::string_view value, bool fallback) {
  if (value == "1" || value == "true" || value == "True") {
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    return false;
  }
  return fallback;
}

template <typename T>
bool parse_number(const std::string& value, T* out) {
  std::istringstream iss(value);
  T parsed{};
  if (!(iss >> parsed) || !iss.eof()) {
    return false;
  }
  *out = parsed;
  return true;
}

ViewerPersistentSettings LoadViewerPersistentSettings() {
  ViewerPersistentSettings settings{};
  std::ifstream ifs(kViewerSettingsFile);
  if (!ifs.is_open()) {
    return settings;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= line.size()) {
      continue;
    }
    const std::string key = line.substr(0, eq);
    const std::string value = line.substr(eq + 1);
    int int_value = 0;
    float float_value = 0.0f;
    // Malformed values keep the defaults.
    if (key == "window_width" && parse_number(value, &int_value)) {
      settings.window_width = std::max(640, int_value);
    } else if (key == "window_height" && parse_number(value, &int_value)) {
      settings.window_height = std::max(480, int_value);
    } else if (key == "ui_unified_workspace") {
      settings.ui_unified_workspace = parse_bool(value, settings.ui_unified_workspace);
    } else if (key == "ui_show_workspace") {
      settings.ui_show_workspace = parse_bool(value, settings.ui_show_workspace);
    } else if (key == "ui_workspace_width" && parse_number(value, &float_value)) {
      settings.ui_workspace_width = std::clamp(float_value, 300.0f, 900.0f);
    } else if (key == "show_grid_lines") {
      settings.show_grid_lines = parse_bool(value, settings.show_grid_lines);
    }
  }
  return settings;
}

void SaveViewerPersistentSettings(const ViewerPersistentSettings& settings) {
  std::ofstream ofs(kViewerSettingsFile, std::ios::trunc);
  if (!ofs.is_open()) {
    return;
  }
  ofs << "window_width=" << settings.window_width << "\n";
  ofs << "window_height=" << settings.window_height << "\n";
  ofs << "ui_unified_workspace=" << (settings.ui_unified_workspace ? 1 : 0) << "\n";
  ofs << "ui_show_workspace=" << (settings.ui_show_workspace ? 1 : 0) << "\n";
  ofs << "ui_workspace_width=" << settings.ui_workspace_width << "\n";
  ofs << "show_grid_lines=" << (settings.show_grid_lines ? 1 : 0) << "\n";
}

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > 12) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

const char* ToolLabel(ToolKind tool) {
  switch (tool) {
  case ToolKind::kSelect:
    return "Select";
  case ToolKind::kPlace:
    return "Place";
  case ToolKind::kDelete:
    return "Delete";
  case ToolKind::kRotate:
    return "Rotate";
  case ToolKind::kPaint:
    return "Paint";
  case ToolKind::kMove:
    return "Move";
  case ToolKind::kMultiDrop:
    return "MultiDrop";
  default:
    return "Unknown";
  }
}

Vector3 ToRaylib(const pontoon::core::Vec3d& world) {
  return Vector3{static_cast<float>(world.x), static_cast<float>(world.y), static_cast<float>(world.z)};
}

pontoon::core::Vec3d FromRaylib(const Vector3& v) {
  return pontoon::core::Vec3d{static_cast<double>(v.x), static_cast<double>(v.y), static_cast<double>(v.z)};
}

Color ToRaylibColor(PontoonColor color, unsigned char alpha = 255) {
  const std::uint32_t hex = pontoon::core::color_hex(color);
  return Color{static_cast<unsigned char>((hex >> 16) & 0xff), static_cast<unsigned char>((hex >> 8) & 0xff),
               static_cast<unsigned char>(hex & 0xff), alpha};
}

pontoon::core::ViewContext MakeViewContext(const Camera3D& camera) {
  pontoon::core::ViewContext view;
  view.camera.position = FromRaylib(camera.position);
  view.camera.target = FromRaylib(camera.target);
  view.camera.up = FromRaylib(camera.up);
  view.camera.fovy_deg = camera.fovy;
  view.camera.projection = (camera.projection == CAMERA_ORTHOGRAPHIC)
                               ? pontoon::core::CameraProjection::kOrthographic
                               : pontoon::core::CameraProjection::kPerspective;
  view.viewport = {static_cast<double>(GetScreenWidth()), static_cast<double>(GetScreenHeight())};
  return view;
}

pontoon::core::InputEvent MakeEvent(pontoon::core::InputKind kind) {
  pontoon::core::InputEvent event;
  event.kind = kind;
  const Vector2 mouse = GetMousePosition();
  event.pointer = {mouse.x, mouse.y};
  event.modifiers.shift = IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT);
  event.modifiers.ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL);
  event.modifiers.alt = IsKeyDown(KEY_LEFT_ALT) || IsKeyDown(KEY_RIGHT_ALT);
  event.timestamp_ms = static_cast<std::int64_t>(GetTime() * 1000.0);
  return event;
}

void ReportResult(ViewerUiState& ui_state, const pontoon::core::PipelineResult& result) {
  if (result.outcome == pontoon::core::PipelineOutcome::kCommitted) {
    if (!result.operations.empty()) {
      PushLog(ui_state, "[edit] " + result.operations.back().description);
    }
  } else if (result.outcome == pontoon::core::PipelineOutcome::kRejected ||
             result.outcome == pontoon::core::PipelineOutcome::kDropped) {
    PushLog(ui_state, "[error] " + (result.errors.empty() ? std::string("input rejected") : result.errors.front()));
  }
}

void HandleResultError(ViewerUiState& ui_state, const std::vector<std::string>& errors, const std::string& ok_log,
                       bool ok) {
  if (ok) {
    PushLog(ui_state, ok_log);
    return;
  }
  PushLog(ui_state, "[error] " + (errors.empty() ? std::string("edit failed") : errors.front()));
}

void OrbitCameraTurntable(Camera3D* camera, Vector2 mouse_delta, float orbit_speed) {
  const Vector3 offset = Vector3Subtract(camera->position, camera->target);
  const float radius = Vector3Length(offset);
  if (radius <= 1e-5f) {
    return;
  }

  float yaw = std::atan2(offset.z, offset.x);
  float pitch = std::asin(offset.y / radius);

  yaw -= mouse_delta.x * orbit_speed;
  pitch -= mouse_delta.y * orbit_speed;

  const float pitch_limit = 1.55334f; // about 89 degrees
  pitch = std::clamp(pitch, 0.05f, pitch_limit);

  const float cos_pitch = std::cos(pitch);
  const Vector3 new_offset{
      radius * cos_pitch * std::cos(yaw),
      radius * std::sin(pitch),
      radius * cos_pitch * std::sin(yaw),
  };
  camera->position = Vector3Add(camera->target, new_offset);
}

void PanCamera(Camera3D* camera, Vector2 mouse_delta, float pan_speed) {
  const Vector3 forward = Vector3Normalize(Vector3Subtract(camera->target, camera->position));
  const Vector3 right = Vector3Normalize(Vector3CrossProduct(forward, camera->up));
  const Vector3 up = Vector3Normalize(Vector3CrossProduct(right, forward));
  const float distance = Vector3Distance(camera->position, camera->target);
  const float scale = pan_speed * std::max(0.1f, distance);

  const Vector3 pan = Vector3Add(Vector3Scale(right, -mouse_delta.x * scale), Vector3Scale(up, mouse_delta.y * scale));
  camera->position = Vector3Add(camera->position, pan);
  camera->target = Vector3Add(camera->target, pan);
}

void DollyCamera(Camera3D* camera, float amount, float dolly_speed) {
  const Vector3 view = Vector3Subtract(camera->position, camera->target);
  float distance = std::max(1e-5f, Vector3Length(view));
  distance *= (1.0f + amount * dolly_speed);
  distance = std::clamp(distance, 1.0f, 500.0f);
  camera->position = Vector3Add(camera->target, Vector3Scale(Vector3Normalize(view), distance));
}

void UpdateCameraForViewport(Camera3D* camera, ViewerUiState& ui_state) {
  const ImGuiIO& io = ImGui::GetIO();
  const Vector2 mouse_delta = GetMouseDelta();
  const bool shift = IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT);
  const bool ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL);

  if (!io.WantCaptureMouse && IsMouseButtonPressed(MOUSE_BUTTON_MIDDLE)) {
    if (shift) {
      ui_state.camera_drag_mode = CameraDragMode::kPan;
    } else if (ctrl) {
      ui_state.camera_drag_mode = CameraDragMode::kDolly;
    } else {
      ui_state.camera_drag_mode = CameraDragMode::kOrbit;
    }
    DisableCursor();
  }

  if (ui_state.camera_drag_mode != CameraDragMode::kNone) {
    if (ui_state.camera_drag_mode == CameraDragMode::kOrbit) {
      OrbitCameraTurntable(camera, mouse_delta, 0.006f);
    } else if (ui_state.camera_drag_mode == CameraDragMode::kPan) {
      PanCamera(camera, mouse_delta, 0.002f);
    } else {
      DollyCamera(camera, mouse_delta.y, 0.01f);
    }
    if (IsMouseButtonReleased(MOUSE_BUTTON_MIDDLE)) {
      ui_state.camera_drag_mode = CameraDragMode::kNone;
      EnableCursor();
    }
  }

  if (!io.WantCaptureMouse && ui_state.camera_drag_mode == CameraDragMode::kNone) {
    const float wheel = GetMouseWheelMove();
    if (std::fabs(wheel) > 0.0f) {
      DollyCamera(camera, -wheel, 0.12f);
    }
  }
}

// Translates raylib mouse/keyboard state into pipeline input events.
void UpdateEditorInput(Configurator& editor, const Camera3D& camera, ViewerUiState& ui_state) {
  using pontoon::core::InputKind;
  const ImGuiIO& io = ImGui::GetIO();
  const pontoon::core::ViewContext view = MakeViewContext(camera);
  const bool camera_busy = ui_state.camera_drag_mode != CameraDragMode::kNone;
  const bool pointer_available = !io.WantCaptureMouse && !camera_busy && IsCursorOnScreen();

  if (!pointer_available) {
    if (ui_state.pointer_on_grid_view) {
      editor.ProcessInput(MakeEvent(InputKind::kPointerLeave), view, ui_state.tool);
      ui_state.pointer_on_grid_view = false;
      ui_state.press_pending = false;
    }
  } else {
    ui_state.pointer_on_grid_view = true;
    const Vector2 delta = GetMouseDelta();
    if (delta.x != 0.0f || delta.y != 0.0f) {
      editor.ProcessInput(MakeEvent(InputKind::kPointerMove), view, ui_state.tool);
    }

    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
      ui_state.press_position = GetMousePosition();
      ui_state.press_pending = true;
      if (ui_state.tool.tool == ToolKind::kMultiDrop) {
        ReportResult(ui_state, editor.ProcessInput(MakeEvent(InputKind::kPointerDown), view, ui_state.tool));
      }
    }
    if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT) && ui_state.press_pending) {
      ui_state.press_pending = false;
      if (ui_state.tool.tool == ToolKind::kMultiDrop) {
        ReportResult(ui_state, editor.ProcessInput(MakeEvent(InputKind::kPointerUp), view, ui_state.tool));
      } else if (Vector2Distance(ui_state.press_position, GetMousePosition()) < 6.0f) {
        ReportResult(ui_state, editor.ProcessInput(MakeEvent(InputKind::kClick), view, ui_state.tool));
      }
    }
    if (IsMouseButtonPressed(MOUSE_BUTTON_RIGHT)) {
      editor.ProcessInput(MakeEvent(InputKind::kCancel), view, ui_state.tool);
    }
  }

  if (io.WantCaptureKeyboard) {
    return;
  }
  const std::array<std::pair<int, pontoon::core::Key>, 5> bindings = {{
      {KEY_DELETE, pontoon::core::Key::kDelete},
      {KEY_BACKSPACE, pontoon::core::Key::kDelete},
      {KEY_Z, pontoon::core::Key::kZ},
      {KEY_Y, pontoon::core::Key::kY},
      {KEY_ESCAPE, pontoon::core::Key::kEscape},
  }};
  for (const auto& [raylib_key, key] : bindings) {
    if (!IsKeyPressed(raylib_key)) {
      continue;
    }
    pontoon::core::InputEvent event = MakeEvent(InputKind::kKey);
    event.key = key;
    ReportResult(ui_state, editor.ProcessInput(event, view, ui_state.tool));
  }

  // Number keys pick the active level relative to the lowest one.
  const pontoon::core::GridDimensions& dims = editor.grid().dimensions();
  for (int i = 0; i < std::min(dims.levels, 9); ++i) {
    if (IsKeyPressed(KEY_ONE + i)) {
      ui_state.tool.active_level = dims.min_level + i;
    }
  }
}

void DrawAxes() {
  DrawLine3D({0.0f, 0.0f, 0.0f}, {kAxisLength, 0.0f, 0.0f}, RED);
  DrawLine3D({0.0f, 0.0f, 0.0f}, {0.0f, kAxisLength, 0.0f}, GREEN);
  DrawLine3D({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, kAxisLength}, BLUE);
}

void DrawGridLines(const Configurator& editor, int level) {
  const pontoon::core::GridDimensions& dims = editor.grid().dimensions();
  const pontoon::core::CoordinateCalculator& calc = editor.coordinates();
  const Color line{90, 110, 130, 160};
  for (int ix = 0; ix <= dims.width; ++ix) {
    DrawLine3D(ToRaylib(calc.GridIntersectionToWorld(ix, 0, level, dims)),
               ToRaylib(calc.GridIntersectionToWorld(ix, dims.height, level, dims)), line);
  }
  for (int iz = 0; iz <= dims.height; ++iz) {
    DrawLine3D(ToRaylib(calc.GridIntersectionToWorld(0, iz, level, dims)),
               ToRaylib(calc.GridIntersectionToWorld(dims.width, iz, level, dims)), line);
  }
}

void DrawCellBox(const Configurator& editor, const pontoon::core::GridPosition& cell, Color color, bool solid) {
  const double cell_size = editor.coordinates().settings().cell_size_m;
  const double level_height = editor.coordinates().settings().level_height_m;
  Vector3 center = ToRaylib(editor.coordinates().GridToWorld(cell, editor.grid().dimensions()));
  center.y += static_cast<float>(level_height * 0.5);
  const float size = static_cast<float>(cell_size * 0.96);
  const float height = static_cast<float>(level_height * 0.9);
  if (solid) {
    DrawCube(center, size, height, size, color);
  } else {
    DrawCubeWires(center, size, height, size, color);
  }
}

void DrawPontoons(const Configurator& editor, const ViewerUiState& ui_state) {
  const pontoon::core::PipelineOverlay overlay = editor.overlay();
  const double cell_size = editor.coordinates().settings().cell_size_m;
  const double level_height = editor.coordinates().settings().level_height_m;
  for (const pontoon::core::Pontoon& pontoon : editor.grid().pontoons()) {
    const pontoon::core::FootprintExtent extent = pontoon::core::footprint_extent(pontoon.type);
    Vector3 center =
        ToRaylib(editor.coordinates().FootprintCenter(pontoon.position, pontoon.type, editor.grid().dimensions()));
    center.y += static_cast<float>(level_height * 0.5);
    const float sx = static_cast<float>(extent.x * cell_size - cell_size * 0.04);
    const float sy = static_cast<float>(level_height * 0.9);
    const float sz = static_cast<float>(extent.z * cell_size - cell_size * 0.04);
    const bool dimmed = pontoon.position.y > ui_state.tool.active_level;
    DrawCube(center, sx, sy, sz, ToRaylibColor(pontoon.color, dimmed ? 90 : 255));

    const bool selected = std::find(overlay.selection.begin(), overlay.selection.end(), pontoon.id) !=
                              overlay.selection.end() ||
                          pontoon.id == overlay.move_source_id || pontoon.id == ui_state.inspected_id;
    DrawCubeWires(center, sx, sy, sz, selected ? ORANGE : Color{20, 24, 30, 255});
  }

  if (overlay.hover.has_value()) {
    const Color hover_color = overlay.hover->valid ? Color{80, 220, 120, 200} : Color{230, 70, 70, 200};
    for (const pontoon::core::GridPosition& cell : overlay.hover->footprint) {
      DrawCellBox(editor, cell, hover_color, false);
    }
  }
  if (overlay.multi_drop_active) {
    for (const pontoon::core::GridPosition& cell : overlay.multi_drop_cells) {
      const bool ok = editor.CanPlace(cell, ui_state.tool.type).ok();
      for (const pontoon::core::GridPosition& covered : pontoon::core::footprint_of(cell, ui_state.tool.type)) {
        DrawCellBox(editor, covered, ok ? Color{80, 220, 120, 90} : Color{230, 70, 70, 90}, true);
      }
    }
  }
}

void DrawToolButtons(ViewerUiState& ui_state) {
  const std::array<ToolKind, 7> tools = {ToolKind::kSelect, ToolKind::kPlace,  ToolKind::kDelete,   ToolKind::kRotate,
                                         ToolKind::kPaint,  ToolKind::kMove,   ToolKind::kMultiDrop};
  for (std::size_t i = 0; i < tools.size(); ++i) {
    const bool active = (ui_state.tool.tool == tools[i]);
    if (active) {
      ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.22f, 0.34f, 0.48f, 1.0f));
      ImGui::PushStyleColor(ImGuiCol_ButtonHovered, ImVec4(0.26f, 0.40f, 0.58f, 1.0f));
    }
    if (ImGui::Button(ToolLabel(tools[i]))) {
      ui_state.tool.tool = tools[i];
    }
    if (active) {
      ImGui::PopStyleColor(2);
    }
    if (i + 1 < tools.size()) {
      ImGui::SameLine();
    }
  }
}

void DrawTopbarWindow(const Configurator& editor, ViewerUiState& ui_state) {
  const float w = static_cast<float>(GetScreenWidth());
  ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(std::max(320.0f, w - 16.0f), kTopbarHeight), ImGuiCond_Always);
  const ImGuiWindowFlags flags =
      ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
  if (!ImGui::Begin("Topbar", nullptr, flags)) {
    ImGui::End();
    return;
  }

  DrawToolButtons(ui_state);
  ImGui::SameLine();
  ImGui::SetCursorPosX(std::max(ImGui::GetCursorPosX(), ImGui::GetWindowWidth() - 250.0f));
  ImGui::Checkbox("Unified UI", &ui_state.ui_unified_workspace);
  ImGui::SameLine();
  ImGui::Checkbox("Show Workspace", &ui_state.ui_show_workspace);
  ImGui::Separator();

  const pontoon::core::GridDimensions& dims = editor.grid().dimensions();
  ImGui::Text("Pontoons:%d  Grid:%dx%dx%d  Level:%d", static_cast<int>(editor.grid().size()), dims.width,
              dims.height, dims.levels, ui_state.tool.active_level);
  ImGui::SameLine();
  ImGui::Text("|  Tool: %s", ToolLabel(ui_state.tool.tool));
  if (editor.pipeline().move_state() == pontoon::core::MoveToolState::kSelected) {
    ImGui::SameLine();
    ImGui::Text("|  Moving %s", pontoon::core::pontoon_display_id(editor.pipeline().move_source_id()).c_str());
  }
  ImGui::End();
}

void DrawToolboxContent(Configurator& editor, ViewerUiState& ui_state) {
  ImGui::Text("Active Tool: %s", ToolLabel(ui_state.tool.tool));
  ImGui::Separator();

  int type_index = static_cast<int>(ui_state.tool.type);
  const char* type_labels[] = {"Single Pontoon", "Double Pontoon"};
  if (ImGui::Combo("Type", &type_index, type_labels, 2)) {
    ui_state.tool.type = pontoon::core::kAllPontoonTypes[static_cast<std::size_t>(type_index)];
  }

  if (ImGui::BeginCombo("Color", std::string(pontoon::core::display_name(ui_state.tool.color)).c_str())) {
    for (PontoonColor color : pontoon::core::kAllPontoonColors) {
      const bool selected = color == ui_state.tool.color;
      if (ImGui::Selectable(std::string(pontoon::core::display_name(color)).c_str(), selected)) {
        ui_state.tool.color = color;
      }
    }
    ImGui::EndCombo();
  }

  int rotation_deg = pontoon::core::rotation_degrees(ui_state.tool.rotation);
  if (ImGui::SliderInt("Rotation", &rotation_deg, 0, 270, "%d deg")) {
    const int snapped = ((rotation_deg + 45) / 90) * 90 % 360;
    if (const auto rotation = pontoon::core::rotation_from_degrees(snapped); rotation.has_value()) {
      ui_state.tool.rotation = *rotation;
    }
  }

  const pontoon::core::GridDimensions& dims = editor.grid().dimensions();
  ImGui::SliderInt("Active Level", &ui_state.tool.active_level, dims.min_level, dims.max_level());
  ImGui::Checkbox("Grid Lines", &ui_state.show_grid_lines);

  ImGui::Separator();
  ImGui::BeginDisabled(!editor.history().can_undo());
  if (ImGui::Button("Undo")) {
    PushLog(ui_state, editor.Undo() ? "[history] undo" : "[history] nothing to undo");
  }
  ImGui::EndDisabled();
  ImGui::SameLine();
  ImGui::BeginDisabled(!editor.history().can_redo());
  if (ImGui::Button("Redo")) {
    PushLog(ui_state, editor.Redo() ? "[history] redo" : "[history] nothing to redo");
  }
  ImGui::EndDisabled();

  ImGui::InputText("Label", ui_state.checkpoint_label, sizeof(ui_state.checkpoint_label));
  if (ImGui::Button("Create Checkpoint")) {
    const auto result = editor.CreateCheckpoint(ui_state.checkpoint_label);
    HandleResultError(ui_state, result.errors, "[history] checkpoint #" + std::to_string(result.value), result.ok);
  }
  for (const pontoon::core::HistoryEntry* checkpoint : editor.history().Checkpoints()) {
    ImGui::PushID(static_cast<int>(checkpoint->id));
    ImGui::Text("#%llu %s", static_cast<unsigned long long>(checkpoint->id), checkpoint->description.c_str());
    ImGui::SameLine();
    if (ImGui::SmallButton("Rollback")) {
      const auto result = editor.RollbackToCheckpoint(checkpoint->id);
      HandleResultError(ui_state, result.errors, "[history] rolled back to " + checkpoint->description, result.ok);
      ImGui::PopID();
      break;
    }
    ImGui::PopID();
  }

  ImGui::Separator();
  ImGui::InputInt("Width", &ui_state.new_grid_width);
  ImGui::InputInt("Height", &ui_state.new_grid_height);
  ImGui::InputInt("Levels", &ui_state.new_grid_levels);
  ImGui::InputInt("Min Level", &ui_state.new_grid_min_level);
  if (ImGui::Button("New Grid")) {
    const pontoon::core::GridDimensions requested{ui_state.new_grid_width, ui_state.new_grid_height,
                                                  ui_state.new_grid_levels, ui_state.new_grid_min_level};
    const auto result = editor.NewGrid(requested);
    HandleResultError(ui_state, result.errors, "[grid] new grid", result.ok);
    if (result.ok) {
      ui_state.tool.active_level = requested.min_level;
      ui_state.inspected_id = pontoon::core::kInvalidObjectId;
    }
  }
  ImGui::SameLine();
  if (ImGui::Button("Reload Layout")) {
    const auto result = editor.LoadPortable(editor.ToPortable());
    HandleResultError(ui_state, result.errors, "[grid] layout reloaded from portable form", result.ok);
  }
}

void DrawToolboxWindow(Configurator& editor, ViewerUiState& ui_state) {
  ImGui::SetNextWindowPos(ImVec2(8.0f, 90.0f), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(420.0f, 520.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Toolbox", nullptr, ImGuiWindowFlags_NoCollapse)) {
    ImGui::End();
    return;
  }
  DrawToolboxContent(editor, ui_state);
  ImGui::End();
}

void DrawInspectorContent(Configurator& editor, ViewerUiState& ui_state) {
  if (ui_state.inspected_id == pontoon::core::kInvalidObjectId) {
    const auto& selection = editor.pipeline().selection();
    if (!selection.empty()) {
      ui_state.inspected_id = selection.back();
    }
  }
  const pontoon::core::Pontoon* pontoon = editor.grid().find(ui_state.inspected_id);
  if (pontoon == nullptr) {
    ImGui::TextUnformatted("No pontoon selected.");
    return;
  }

  const ObjectId id = pontoon->id;
  ImGui::Text("Id: %s", pontoon::core::pontoon_display_id(id).c_str());
  ImGui::Text("Position: %s", pontoon::core::to_string(pontoon->position).c_str());
  ImGui::Text("Type: %s", std::string(pontoon::core::display_name(pontoon->type)).c_str());
  ImGui::Text("Color: %s", std::string(pontoon::core::display_name(pontoon->color)).c_str());
  ImGui::Text("Rotation: %d deg", pontoon::core::rotation_degrees(pontoon->rotation));
  ImGui::Text("History entries: %d", static_cast<int>(editor.history().EntriesAffecting(id).size()));
  ImGui::Separator();

  if (ImGui::Button("Rotate")) {
    const auto result = editor.RotatePontoon(id);
    HandleResultError(ui_state, result.errors, "[edit] rotated " + pontoon::core::pontoon_display_id(id), result.ok);
  }
  ImGui::SameLine();
  if (ImGui::Button("Apply Tool Color")) {
    const auto result = editor.RecolorPontoon(id, ui_state.tool.color);
    HandleResultError(ui_state, result.errors, "[edit] recolored " + pontoon::core::pontoon_display_id(id), result.ok);
  }
  ImGui::SameLine();
  if (ImGui::Button("Remove")) {
    const auto result = editor.RemovePontoon(id);
    HandleResultError(ui_state, result.errors, "[edit] removed " + pontoon::core::pontoon_display_id(id), result.ok);
    if (result.ok) {
      ui_state.inspected_id = pontoon::core::kInvalidObjectId;
    }
  }
}

void DrawInspectorWindow(Configurator& editor, ViewerUiState& ui_state) {
  const float w = static_cast<float>(GetScreenWidth());
  ImGui::SetNextWindowPos(ImVec2(std::max(440.0f, w - 430.0f), 90.0f), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(420.0f, 260.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Inspector", nullptr, ImGuiWindowFlags_NoCollapse)) {
    ImGui::End();
    return;
  }
  DrawInspectorContent(editor, ui_state);
  ImGui::End();
}

void DrawOutlinerContent(const Configurator& editor, ViewerUiState& ui_state) {
  const pontoon::core::GridDimensions& dims = editor.grid().dimensions();
  for (int level = dims.min_level; level <= dims.max_level(); ++level) {
    const std::vector<pontoon::core::Pontoon> pontoons = editor.PontoonsAtLevel(level);
    const std::string header = "Level " + std::to_string(level) + " (" + std::to_string(pontoons.size()) + ")";
    if (!ImGui::CollapsingHeader(header.c_str(), ImGuiTreeNodeFlags_DefaultOpen)) {
      continue;
    }
    for (const pontoon::core::Pontoon& pontoon : pontoons) {
      const std::string label = pontoon::core::pontoon_display_id(pontoon.id) + "  " +
                                std::string(pontoon::core::to_string(pontoon.type)) + " @ " +
                                pontoon::core::to_string(pontoon.position);
      if (ImGui::Selectable(label.c_str(), pontoon.id == ui_state.inspected_id)) {
        ui_state.inspected_id = pontoon.id;
      }
    }
  }
}

void DrawOutlinerWindow(const Configurator& editor, ViewerUiState& ui_state) {
  ImGui::SetNextWindowPos(ImVec2(8.0f, 620.0f), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(420.0f, 240.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Outliner", nullptr, ImGuiWindowFlags_NoCollapse)) {
    ImGui::End();
    return;
  }
  DrawOutlinerContent(editor, ui_state);
  ImGui::End();
}

void DrawDiagnosticsContent(Configurator& editor, ViewerUiState& ui_state) {
  const pontoon::core::GridStatistics stats = editor.Statistics();
  ImGui::Text("Pontoons: %d  Cells: %d / %d (%.1f%%)", static_cast<int>(stats.pontoon_count),
              static_cast<int>(stats.occupied_cells), static_cast<int>(stats.total_cells),
              stats.utilization_percent);
  for (const auto& [color, count] : stats.pontoons_by_color) {
    ImGui::SameLine();
    ImGui::TextColored(ImVec4(ToRaylibColor(color).r / 255.0f, ToRaylibColor(color).g / 255.0f,
                              ToRaylibColor(color).b / 255.0f, 1.0f),
                       "%s:%d", std::string(pontoon::core::to_string(color)).c_str(), static_cast<int>(count));
  }

  if (ImGui::Button("Check Connectivity")) {
    const pontoon::core::ValidationResult connectivity = editor.ValidateConnectivity();
    if (connectivity.ok()) {
      PushLog(ui_state, "[check] platform is connected");
    }
    for (const std::string& message : connectivity.messages()) {
      PushLog(ui_state, "[check] " + message);
    }
  }
  ImGui::SameLine();
  if (ImGui::Button("Check Index")) {
    const pontoon::core::ValidationResult consistency = editor.index().CheckConsistency(editor.grid());
    PushLog(ui_state, consistency.ok() ? "[check] spatial index consistent"
                                       : "[check] " + consistency.messages().front());
  }

  const pontoon::core::PipelineStats& pipeline = editor.pipeline().stats();
  ImGui::Text("Pipeline: processed %d  committed %d  rejected %d  dropped %d  rebuilds %d",
              static_cast<int>(pipeline.processed), static_cast<int>(pipeline.committed),
              static_cast<int>(pipeline.rejected), static_cast<int>(pipeline.dropped),
              static_cast<int>(pipeline.index_rebuilds));
  const pontoon::core::CoordinateCacheStats cache = editor.coordinates().cache_stats();
  ImGui::Text("Coordinate cache: %d entries  %d hits  %d misses  %d invalidations", static_cast<int>(cache.entries),
              static_cast<int>(cache.hits), static_cast<int>(cache.misses), static_cast<int>(cache.invalidations));
  const pontoon::core::HistoryStats history = editor.history().Stats();
  ImGui::Text("History: %d / %d applied  %d checkpoints  %d evicted", static_cast<int>(history.applied_count),
              static_cast<int>(history.entry_count), static_cast<int>(history.checkpoint_count),
              static_cast<int>(history.evicted_total));

  const pontoon::core::PipelineOverlay overlay = editor.overlay();
  if (const auto& hover = overlay.hover; hover.has_value()) {
    ImGui::Text("Hover %s: %s", pontoon::core::to_string(hover->cell).c_str(), hover->valid ? "valid" : "invalid");
    for (const pontoon::core::ValidationIssue& issue : hover->issues) {
      ImGui::BulletText("%s %s", std::string(pontoon::core::to_string(issue.code)).c_str(), issue.message.c_str());
    }
  }

  ImGui::Separator();
  ImGui::TextUnformatted("Events");
  const auto& events = editor.event_log().events();
  const std::size_t first = events.size() > 8 ? events.size() - 8 : 0;
  for (std::size_t i = first; i < events.size(); ++i) {
    ImGui::Text("#%llu %s %s", static_cast<unsigned long long>(events[i].sequence),
                std::string(pontoon::core::to_string(events[i].kind)).c_str(), events[i].message.c_str());
  }
  ImGui::Separator();
  ImGui::TextUnformatted("Log");
  for (const std::string& line : ui_state.logs) {
    ImGui::TextUnformatted(line.c_str());
  }
}

void DrawDiagnosticsWindow(Configurator& editor, ViewerUiState& ui_state) {
  const float w = static_cast<float>(GetScreenWidth());
  const float h = static_cast<float>(GetScreenHeight());
  ImGui::SetNextWindowPos(ImVec2(std::max(440.0f, w - 430.0f), std::max(90.0f, h - 360.0f)), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(420.0f, 340.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Diagnostics", nullptr, ImGuiWindowFlags_NoCollapse)) {
    ImGui::End();
    return;
  }
  DrawDiagnosticsContent(editor, ui_state);
  ImGui::End();
}

void DrawUnifiedWorkspaceWindow(Configurator& editor, ViewerUiState& ui_state) {
  if (!ui_state.ui_show_workspace) {
    return;
  }
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float margin = 8.0f;
  const float min_w = 300.0f;
  const float max_w = std::max(min_w, screen_w - margin * 2.0f);
  if (ui_state.ui_workspace_width <= 1.0f) {
    ui_state.ui_workspace_width = std::clamp(screen_w * 0.36f, min_w, std::min(760.0f, max_w));
  }
  ui_state.ui_workspace_width = std::clamp(ui_state.ui_workspace_width, min_w, std::min(760.0f, max_w));
  const float x = std::max(margin, screen_w - ui_state.ui_workspace_width - margin);
  const float y = kTopbarHeight + margin + 8.0f;
  const float h = std::max(240.0f, screen_h - y - margin);

  ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(ui_state.ui_workspace_width, h), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSizeConstraints(ImVec2(min_w, 240.0f), ImVec2(std::min(760.0f, max_w), h));
  if (!ImGui::Begin("Workspace", nullptr, ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove)) {
    ImGui::End();
    return;
  }
  ui_state.ui_workspace_width = ImGui::GetWindowSize().x;
  if (ImGui::BeginTabBar("WorkspaceTabs")) {
    if (ImGui::BeginTabItem("Toolbox")) {
      DrawToolboxContent(editor, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Inspector")) {
      DrawInspectorContent(editor, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Outliner")) {
      DrawOutlinerContent(editor, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Diagnostics")) {
      DrawDiagnosticsContent(editor, ui_state);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::End();
}

void DrawPanels(Configurator& editor, ViewerUiState& ui_state) {
  DrawTopbarWindow(editor, ui_state);
  if (ui_state.ui_unified_workspace) {
    DrawUnifiedWorkspaceWindow(editor, ui_state);
  } else {
    DrawToolboxWindow(editor, ui_state);
    DrawInspectorWindow(editor, ui_state);
    DrawOutlinerWindow(editor, ui_state);
    DrawDiagnosticsWindow(editor, ui_state);
  }
}

void SeedDemoLayout(Configurator& editor, ViewerUiState& ui_state) {
  std::vector<pontoon::core::GridPosition> deck;
  for (const pontoon::core::GridPosition& cell : pontoon::core::cells_in_box({6, 0, 6}, {13, 0, 11})) {
    deck.push_back(cell);
  }
  const auto base = editor.PlacePontoonsBatch(deck, PontoonType::kSingle, PontoonColor::kGrey);
  HandleResultError(ui_state, base.errors,
                    "[info] demo deck: " + std::to_string(base.value.affected_ids.size()) + " pontoons", base.ok);
  const auto upper = editor.PlacePontoonsBatch({{8, 1, 8}, {10, 1, 8}, {8, 1, 9}, {10, 1, 9}}, PontoonType::kDouble,
                                               PontoonColor::kBlue, Rotation::kEast);
  HandleResultError(ui_state, upper.errors, "[info] demo upper deck placed", upper.ok);
}

} // namespace

int main() {
  const ViewerPersistentSettings persisted = LoadViewerPersistentSettings();
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(persisted.window_width, persisted.window_height, "pontoon viewer");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  Camera3D camera{};
  camera.position = {9.0f, 11.0f, 9.0f};
  camera.target = {0.0f, 0.0f, 0.0f};
  camera.up = {0.0f, 1.0f, 0.0f};
  camera.fovy = 45.0f;
  camera.projection = CAMERA_PERSPECTIVE;

  Configurator editor(pontoon::core::GridDimensions{20, 20, 3, 0});
  ViewerUiState ui_state;
  ui_state.ui_unified_workspace = persisted.ui_unified_workspace;
  ui_state.ui_show_workspace = persisted.ui_show_workspace;
  ui_state.ui_workspace_width = persisted.ui_workspace_width;
  ui_state.show_grid_lines = persisted.show_grid_lines;
  PushLog(ui_state, "[info] viewer started");
  SeedDemoLayout(editor, ui_state);
  PushLog(ui_state, "[hint] LMB use tool, RMB cancel, 1-9 pick level");
  PushLog(ui_state, "[hint] MMB orbit, Shift+MMB pan, Ctrl+MMB dolly");
  PushLog(ui_state, "[hint] Ctrl+Z undo, Ctrl+Y redo, Del remove, Esc cancel");

  rlImGuiSetup(true);
  ImGui::StyleColorsDark();
  {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 3.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;
    style.WindowBorderSize = 1.0f;
    style.FrameBorderSize = 0.0f;
  }
  while (!WindowShouldClose()) {
    BeginDrawing();
    ClearBackground(Color{26, 32, 39, 255});

    rlImGuiBegin();
    UpdateCameraForViewport(&camera, ui_state);
    UpdateEditorInput(editor, camera, ui_state);

    BeginMode3D(camera);
    if (ui_state.show_grid_lines) {
      DrawGridLines(editor, ui_state.tool.active_level);
    }
    DrawAxes();
    DrawPontoons(editor, ui_state);
    EndMode3D();

    DrawPanels(editor, ui_state);
    rlImGuiEnd();

    DrawFPS(10, GetScreenHeight() - 24);
    EndDrawing();
  }

  rlImGuiShutdown();
  {
    ViewerPersistentSettings out{};
    out.window_width = GetScreenWidth();
    out.window_height = GetScreenHeight();
    out.ui_unified_workspace = ui_state.ui_unified_workspace;
    out.ui_show_workspace = ui_state.ui_show_workspace;
    out.ui_workspace_width = ui_state.ui_workspace_width;
    out.show_grid_lines = ui_state.show_grid_lines;
    SaveViewerPersistentSettings(out);
  }
  CloseWindow();
  return 0;
}
