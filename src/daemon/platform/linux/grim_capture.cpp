#include "platform/linux/grim_capture.hpp"

#include "image/ppm_decoder.hpp"
#include "platform/linux/subprocess.hpp"
#include "platform/linux/sway_window_manager.hpp"

#include <print>

GrimCapture::GrimCapture(WindowManager* windows, std::string output_name)
    : windows_(windows), output_name_(std::move(output_name)) {}

std::expected<Frame, std::string> GrimCapture::capture() {
    std::vector<std::string> argv = {"grim", "-t", "ppm"};
    if (auto output = resolve_output()) {
        argv.insert(argv.end(), {"-o", *output});
    }
    argv.push_back("-");

    auto data = subprocess::read_stdout(argv);
    if (!data) return std::unexpected(data.error());

    auto frame = ppm::decode(*data);
    if (!frame) return std::unexpected("grim: " + frame.error());
    return frame;
}

std::optional<std::string> GrimCapture::resolve_output() {
    if (resolved_) return resolved_;
    if (!windows_) {
        if (!output_name_.empty()) return output_name_;
        return std::nullopt;
    }

    auto output = select_output(windows_->list_outputs(), output_name_);
    if (!output) {
        std::println(stderr, "capture: no usable output{}",
                     output_name_.empty() ? "" : " named " + output_name_);
        return std::nullopt;
    }
    resolved_ = output->name;
    return resolved_;
}
