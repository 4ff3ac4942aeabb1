#pragma once
#include "scrollstitch/core/CaptureOrchestrator.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <string>

/*
  Helpers shared by the CLI modes: session options, output naming,
  saving and the JSON session manifest.
*/

/* Build a CaptureConfig from the common session options.
   Throws std::invalid_argument on a malformed --crop, --crop-preset or --key. */
scrollstitch::CaptureConfig session_config_from_args(int argc, char** argv);

/* Named screen regions ("1080p", "720p", "4k", "vm-small", ...). */
std::optional<scrollstitch::CropRegion> builtin_crop_preset(const std::string& name);

/* Formats the image writer accepts: png, jpg, jpeg, bmp, tif, tiff, webp. */
bool is_supported_format(const std::string& format);

/* "out" + "png" -> "out.png"; a name that already has an extension is kept. */
std::string build_output_path(const std::string& output, const std::string& format);

/* Save a stitched image (RGB/RGBA/Gray). Prints a short message either way;
   returns false on failure. */
bool save_image(const cv::Mat& image, const std::string& path);

/* Write a JSON description of the session (outcome, counters, alignments). */
bool write_manifest(const std::string& path, const scrollstitch::CaptureResult& res,
                    const scrollstitch::CaptureConfig& cfg, const std::string& mode,
                    const std::string& imagePath);

/* Run a prepared session and write its outputs (--output/--format/--manifest).
   Ctrl+C stops the capture early; the partial image is still saved.
   Returns the process exit code. */
int run_session(const std::string& tag, const scrollstitch::CaptureConfig& cfg,
                scrollstitch::IFrameSource& source, scrollstitch::IScrollDriver& driver,
                int argc, char** argv);
