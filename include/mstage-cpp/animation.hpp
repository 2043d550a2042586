/*
 Copyright 2025 Tomo Sasaki

 Licensed under the Apache License, Version 2.0 (the "License");
 you may not use this file except in compliance with the License.
 You may obtain a copy of the License at

      https://www.apache.org/licenses/LICENSE-2.0

 Unless required by applicable law or agreed to in writing, software
 distributed under the License is distributed on an "AS IS" BASIS,
 WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 See the License for the specific language governing permissions and
 limitations under the License.
*/

#ifndef MSTAGE_ANIMATION_HPP
#define MSTAGE_ANIMATION_HPP

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "matplot/matplot.h"

namespace mstage {

namespace fs = std::filesystem;

// Frame export for a matplot++ figure and GIF assembly with ImageMagick
class Animation {
public:
    struct AnimationConfig {
        int width;               // Figure width in pixels
        int height;              // Figure height in pixels
        int frame_skip;          // Save every nth frame
        int frame_delay;         // Delay between frames in 1/100ths of a second
        std::string temp_dir;    // Directory for temporary frame files
        std::string output_dir;  // Directory for output GIFs
        bool cleanup_frames;     // Whether to delete frame files after creating GIF

        AnimationConfig() :
            width(800),
            height(600),
            frame_skip(1),
            frame_delay(10),
            temp_dir("results/frames"),
            output_dir("results/animations"),
            cleanup_frames(true)
        {}
    };

    explicit Animation(matplot::figure_handle figure,
                       const AnimationConfig& config = AnimationConfig())
        : figure_(figure), config_(config) {
        fs::create_directories(config_.temp_dir);
        fs::create_directories(config_.output_dir);
        figure_->size(config_.width, config_.height);
    }

    // Save the current figure content as frame number frame_number
    void saveFrame(int frame_number) {
        if (frame_number % config_.frame_skip == 0) {
            figure_->save(framePath(frame_number / config_.frame_skip));
        }
    }

    // Assemble all saved frames into output_dir/output_filename
    bool createGif(const std::string& output_filename) {
        std::string command = "convert -delay " + std::to_string(config_.frame_delay) + " " +
                              config_.temp_dir + "/trailer_*.png " +
                              config_.output_dir + "/" + output_filename;

        int result = std::system(command.c_str());

        if (result != 0) {
            std::cerr << "Failed to create GIF. Is ImageMagick installed?" << std::endl;
            return false;
        }

        if (config_.cleanup_frames) {
            cleanupFrames();
        }
        return true;
    }

    void cleanupFrames() {
        for (const auto& entry : fs::directory_iterator(config_.temp_dir)) {
            if (entry.path().extension() == ".png") {
                fs::remove(entry.path());
            }
        }
    }

    // Zero-padded so that the shell glob keeps frame order
    std::string framePath(int index) const {
        char name[32];
        std::snprintf(name, sizeof(name), "trailer_%05d.png", index);
        return config_.temp_dir + "/" + name;
    }

    const AnimationConfig& getConfig() const {
        return config_;
    }

private:
    matplot::figure_handle figure_;
    AnimationConfig config_;
};

} // namespace mstage

#endif // MSTAGE_ANIMATION_HPP
