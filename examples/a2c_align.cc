// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <iomanip>
#include <iostream>

#include <argparse/argparse.hpp>

#include <a2c/engine/align_api.h>
#include <a2c/scene/viewpoint.h>
#include <a2c/scene/viewport_camera.h>
#include "../src/a2c/engine/config.h"
#include "../src/a2c/scene/scene_file.h"

namespace {

void PrintQuat(std::ostream& out, const glm::quat& q) {
  out << std::fixed << std::setprecision(6) << q.w << " " << q.x << " " << q.y
      << " " << q.z;
}

}  // namespace

int main(int argc, char** argv) {
  argparse::ArgumentParser parser("a2c_align");
  parser.add_argument("--config").help("config [.yaml].").default_value("");
  parser.add_argument("--scene").help("scene description [.yaml].").required();
  parser.add_argument("-v", "--viewpoint")
      .help("viewpoint [top, bottom, front, back, right, left].")
      .default_value("top");
  parser.add_argument("-s", "--source")
      .help("orientation source [custom, cursor].")
      .default_value("custom");
  parser.add_argument("--smooth")
      .help("smooth rotation.")
      .default_value(false)
      .implicit_value(true);
  parser.add_argument("--instant")
      .help("instant rotation.")
      .default_value(false)
      .implicit_value(true);
  parser.add_argument("--strategy").help("smooth rotation strategy [duration, frames].");
  parser.add_argument("--debug")
      .help("debug mode.")
      .default_value(false)
      .implicit_value(true);

  a2c::Viewpoint viewpoint = a2c::Viewpoint::Top;
  a2c::OrientationSource source = a2c::OrientationSource::Custom;
  try {
    parser.parse_args(argc, argv);
    viewpoint = a2c::ParseViewpoint(parser.get<std::string>("viewpoint"));
    source = a2c::ParseOrientationSource(parser.get<std::string>("source"));
  } catch (const std::exception& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  try {
    a2c::Config config;
    auto config_filename = parser.get<std::string>("config");
    if (!config_filename.empty()) {
      config = a2c::Config(config_filename);
    }
    if (parser.get<bool>("debug")) {
      config.debug(true);
    }
    if (parser.get<bool>("smooth")) {
      config.smooth(true);
    }
    if (parser.get<bool>("instant")) {
      config.smooth(false);
    }
    if (parser.is_used("strategy")) {
      config.strategy(parser.get<std::string>("strategy"));
    }

    a2c::SceneFile scene_file(parser.get<std::string>("scene"));
    auto viewport = scene_file.MakeViewport();
    viewport->SetOrientationCallback([](const glm::quat& q) {
      PrintQuat(std::cout, q);
      std::cout << std::endl;
    });

    a2c::AlignAPI api(config, viewport, scene_file.MakeScene());
    auto status = api.Align(viewpoint, source);
    api.Wait();

    std::cout << "status: " << a2c::ToString(status) << std::endl;
    std::cout << "orientation: ";
    PrintQuat(std::cout, viewport->Orientation());
    std::cout << std::endl;
  } catch (const std::exception& err) {
    std::cerr << err.what() << std::endl;
    return 1;
  }

  return 0;
}
