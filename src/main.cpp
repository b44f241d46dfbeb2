#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GLFW/glfw3.h>
#include <filesystem>
#include <stdio.h>
#include <string>

#include "ui/app_ui.hpp"
#include "ui/map_widget.hpp"

constexpr const char *WORKSPACE_FILE = "workspace.json";

// Usage: sector_mapper [antenna.csv]
int main(int argc, char **argv)
{
  glfwSetErrorCallback([](int error, const char *description) { fprintf(stderr, "Glfw Error %d: %s\n", error, description); });

  if (!glfwInit())
    return 1;

  // GL 3.0 + GLSL 130
  const char *glsl_version = "#version 130";
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

  GLFWwindow *window = glfwCreateWindow(1280, 720, "Telecom Sector Visualizer", NULL, NULL);
  if (window == NULL)
  {
    glfwTerminate();
    return 1;
  }
  glfwMakeContextCurrent(window);
  glfwSwapInterval(1); // Enable vsync

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO &io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;

  ImGui_ImplGlfw_InitForOpenGL(window, true);
  ImGui_ImplOpenGL3_Init(glsl_version);

  // Application State. Scoped so GL textures are released before the context goes away.
  {
    sector_mapper::map_widget_t map_widget;
    sector_mapper::app_ui_t app_ui;
    app_ui.setup_style();

    if (argc > 1)
    {
      app_ui.load_csv(argv[1], map_widget);
    }
    else if (std::filesystem::exists(WORKSPACE_FILE))
    {
      app_ui.load_workspace(WORKSPACE_FILE, map_widget);
    }

    while (!glfwWindowShouldClose(window))
    {
      glfwPollEvents();

      ImGui_ImplOpenGL3_NewFrame();
      ImGui_ImplGlfw_NewFrame();
      ImGui::NewFrame();

      app_ui.render(map_widget, [window]() { glfwSetWindowShouldClose(window, GLFW_TRUE); });

      ImGui::Render();
      int display_w, display_h;
      glfwGetFramebufferSize(window, &display_w, &display_h);
      glViewport(0, 0, display_w, display_h);
      glClearColor(0.45f, 0.55f, 0.60f, 1.00f);
      glClear(GL_COLOR_BUFFER_BIT);
      ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

      glfwSwapBuffers(window);
    }
  }

  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  glfwDestroyWindow(window);
  glfwTerminate();

  return 0;
}
