/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/CallChain.hpp"
#include "conduct/Task.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace conduct {

std::string CallChain::current_id()
{
    return Task::current().correlation_id();
}

void CallChain::set_current_id(std::string id)
{
    Task::current().set_correlation_id(std::move(id));
}

std::string CallChain::generate()
{
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

CallChain::Scope::Scope(std::string id) : task_(Task::current())
{
    task_.set_correlation_id(std::move(id));
}

CallChain::Scope::~Scope()
{
    task_.set_correlation_id(std::string());
}

} // namespace conduct
