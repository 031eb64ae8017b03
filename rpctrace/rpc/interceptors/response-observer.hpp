#pragma once

#include <boost/optional.hpp>
#include "../../object-pool.hpp"
#include "../../transport/response.hpp"

namespace rpctrace {

// Wraps the response writer of an inbound unary call, recording whether the handler signaled an
// application error and how many bytes it wrote. Everything is forwarded to the wrapped writer
// unchanged.
//
// Observers are pooled. Acquire one per call and drop the pointer once the call's outcome has
// been classified; the observer must not be touched afterwards.
class ResponseObserver : public transport::ResponseWriter,
                         public transport::ApplicationErrorMetaSetter {
 public:
  using Pool = ObjectPool<ResponseObserver>;
  using Ptr = Pool::Ptr;

  static Ptr acquire(transport::ResponseWriter& writer);
  // Pool shared by every call in the process
  static std::shared_ptr<Pool> const& pool();

  Error write(std::string const& data) override;
  void add_headers(transport::Headers const& headers) override;
  void set_application_error() override;
  void set_application_error_meta(transport::ApplicationErrorMeta const& meta) override;

  bool application_error() const { return is_application_error; }
  boost::optional<transport::ApplicationErrorMeta> const& application_error_meta() const {
    return meta;
  }
  std::size_t bytes_written() const { return response_size; }

  // Back to the zero state, wrapping nothing
  void reset();

 private:
  void wrap(transport::ResponseWriter& writer);

  transport::ResponseWriter* writer = nullptr;
  // Set when the wrapped writer can also carry application error details
  transport::ApplicationErrorMetaSetter* meta_setter = nullptr;

  bool is_application_error = false;
  boost::optional<transport::ApplicationErrorMeta> meta;
  std::size_t response_size = 0;
};

}  // namespace rpctrace
