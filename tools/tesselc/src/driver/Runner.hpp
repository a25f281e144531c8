// tools/tesselc/src/driver/Runner.hpp
#pragma once

#include "../cli/Options.hpp"

namespace tesselc::driver {

    /// @brief 파일 하나를 토크나이즈하고 결과/진단을 출력한다.
    int run(const cli::Options& opt);

} // namespace tesselc::driver
