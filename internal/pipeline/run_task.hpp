#pragma once

#include "internal/core/project_state_machine.hpp"

namespace plancast::pipeline {

/*
  A queued pipeline run.

  Owns the ticket, so the project's run lease travels with the task and
  is released when the worker finishes with it.
*/
struct RunTask {
  core::RunTicket ticket;
};

} // namespace plancast::pipeline
