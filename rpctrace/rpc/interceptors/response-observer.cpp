#include "response-observer.hpp"

namespace rpctrace {

std::shared_ptr<ResponseObserver::Pool> const& ResponseObserver::pool() {
  static auto const shared = Pool::make();
  return shared;
}

ResponseObserver::Ptr ResponseObserver::acquire(transport::ResponseWriter& writer) {
  auto observer = pool()->acquire();
  observer->wrap(writer);
  return observer;
}

void ResponseObserver::wrap(transport::ResponseWriter& w) {
  writer = &w;
  meta_setter = dynamic_cast<transport::ApplicationErrorMetaSetter*>(&w);
}

void ResponseObserver::reset() {
  writer = nullptr;
  meta_setter = nullptr;
  is_application_error = false;
  meta = boost::none;
  response_size = 0;
}

Error ResponseObserver::write(std::string const& data) {
  response_size += data.size();
  return writer->write(data);
}

void ResponseObserver::add_headers(transport::Headers const& headers) {
  writer->add_headers(headers);
}

void ResponseObserver::set_application_error() {
  is_application_error = true;
  writer->set_application_error();
}

void ResponseObserver::set_application_error_meta(transport::ApplicationErrorMeta const& m) {
  meta = m;
  if (meta_setter != nullptr) meta_setter->set_application_error_meta(m);
}

}  // namespace rpctrace
