#include "ringtrack/cli.hpp"
#include <opencv2/core.hpp>
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"

namespace ringtrack {

int run_guarded(const std::function<int()>& body,
                const std::function<void()>& on_precondition) {
  try {
    return body();
  } catch (const PreconditionError& e) {
    RINGTRACK_LOG_ERROR(e.what());
    if (on_precondition) {
      on_precondition();
    }
    return 2;
  } catch (const PersistenceError& e) {
    RINGTRACK_LOG_ERROR(e.what());
    return 1;
  } catch (const cv::Exception& e) {
    RINGTRACK_LOG_ERROR("opencv: " << e.what());
    return 1;
  } catch (const std::exception& e) {
    RINGTRACK_LOG_ERROR("unexpected error: " << e.what());
    return 1;
  }
}

}  // namespace ringtrack
