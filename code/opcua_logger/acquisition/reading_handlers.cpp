#include "reading_handlers.hpp"
#include <iostream>

namespace opcualogger {

ConsoleReadingHandler::ConsoleReadingHandler(RecordCodec codec)
    : codec_(codec) {
}

void ConsoleReadingHandler::handleReading(const Reading& reading) {
    if (!verbose_) {
        return;
    }

    // 覆盖状态行后输出
    std::cout << "\r" << (reading.isOk() ? "Logged: " : "Logged failure: ")
              << codec_.format(reading) << std::endl;
}

CompositeReadingHandler::CompositeReadingHandler(std::shared_ptr<IReadingHandler> store_handler,
                                                 std::shared_ptr<ConsoleReadingHandler> console_handler)
    : store_handler_(std::move(store_handler))
    , console_handler_(std::move(console_handler)) {
}

void CompositeReadingHandler::handleReading(const Reading& reading) {
    if (store_handler_) {
        store_handler_->handleReading(reading);
    }
    if (console_handler_) {
        console_handler_->handleReading(reading);
    }
}

} // namespace opcualogger
