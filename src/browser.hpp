#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace lss {

class BrowserError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Opens a URL somewhere the user can see it. Throws BrowserError on failure.
using BrowserOpener = std::function<void(const std::string& url)>;

// Launch the platform's default browser (xdg-open / open) without waiting
// for it. Throws BrowserError if no opener could be started.
void open_browser(const std::string& url);

} // namespace lss
