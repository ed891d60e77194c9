#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace habitat_seg::config {

namespace fs = std::filesystem;

struct ProcessingConfig {
  int crop_size = 1024;
  int stride = 0;                 // 0 = crop_size / 2
  int batch_size = 1;
  std::vector<int> band_order;    // 1-based; empty = 1..input_channels
  float fill_value = 0.0f;        // boundless read padding
  std::string window_function = "bartlett_hann"; // bartlett_hann | hann |
                                                 // triangular | blackman
  bool edge_aware_window = true;  // flatten taper on image-border sides
  bool skip_uniform_tiles = true; // constant tiles bypass inference

  int effective_stride() const { return stride > 0 ? stride : crop_size / 2; }
};

struct PostprocessConfig {
  int blur_kernel_size = 5;  // median blur, odd or 0
  int morph_kernel_size = 0; // open + close, odd or 0

  bool apply_median_blur() const { return blur_kernel_size > 1; }
  bool apply_morphology() const { return morph_kernel_size > 1; }
  bool enabled() const { return apply_median_blur() || apply_morphology(); }
};

struct OutputConfig {
  int nodata_value = 255;        // label for pixels with zero accumulated weight
  bool write_manifest = true;
  bool remove_on_failure = true;
};

struct RuntimeConfig {
  std::string execution_provider = "cpu"; // cpu | cuda
  int device_id = 0;
  int intra_op_threads = 0;               // 0 = runtime default
};

struct Config {
  ProcessingConfig processing;
  PostprocessConfig postprocess;
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace habitat_seg::config
