#pragma once

#include <vector>
#include "server/reporter.hpp"

namespace executor::server::mock {

/**
 * @brief 记录所有上报内容的 reporter，不进行网络通信
 */
struct reporter : public result_reporter {
    std::vector<result_report> reports;

    /**
     * @brief 为 true 时模拟上报失败
     */
    bool unreachable = false;

    void send(const result_report &report) override;
};

}  // namespace executor::server::mock
