// Repository: Mapcycle-enforcer
// Component: EnforcerControl gRPC Service Implementation
// Purpose: Exposes loop status, on-demand ticks and selection preview over gRPC.
// Copyright (c) 2026 RetroVue

#include "EnforcerControlService.h"

#include <chrono>
#include <utility>

#include "mapcycle/util/Logger.hpp"

namespace mapcycle
{
  namespace control
  {

    using util::Logger;

    namespace
    {
      constexpr char kApiVersion[] = "1.0.0";

      v1::TickOutcome ToProto(runtime::TickOutcome outcome)
      {
        switch (outcome)
        {
        case runtime::TickOutcome::kNoChange:
          return v1::TICK_OUTCOME_NO_CHANGE;
        case runtime::TickOutcome::kApplied:
          return v1::TICK_OUTCOME_APPLIED;
        case runtime::TickOutcome::kResolutionFailed:
          return v1::TICK_OUTCOME_RESOLUTION_FAILED;
        case runtime::TickOutcome::kChannelFailed:
          return v1::TICK_OUTCOME_CHANNEL_FAILED;
        case runtime::TickOutcome::kDeadlineExceeded:
          return v1::TICK_OUTCOME_DEADLINE_EXCEEDED;
        }
        return v1::TICK_OUTCOME_UNSPECIFIED;
      }

      void FillSelection(const schedule::ActiveSelection &selection, v1::Selection *out)
      {
        out->set_rotation_name(selection.rotation_name);
        out->set_weekday(schedule::WeekdayName(selection.weekday));
        out->set_block_name(selection.block_name);
        for (const auto &map : selection.desired_maps)
        {
          out->add_desired_maps(map);
        }
      }

      void FillReport(const runtime::TickReport &report, v1::TickReport *out)
      {
        out->set_sequence(report.sequence);
        out->set_started_utc_ms(report.started_utc_ms);
        out->set_finished_utc_ms(report.finished_utc_ms);
        out->set_outcome(ToProto(report.outcome));
        out->set_detail(report.detail);
        if (report.selection.has_value())
        {
          FillSelection(*report.selection, out->mutable_selection());
        }
        if (report.result.has_value())
        {
          out->set_channel_used(reconcile::ChannelUsedName(report.result->channel_used));
          for (const auto &map : report.result->removed)
            out->add_removed(map);
          for (const auto &map : report.result->added)
            out->add_added(map);
        }
        else
        {
          out->set_channel_used(reconcile::ChannelUsedName(reconcile::ChannelUsed::kNone));
        }
      }
    } // namespace

    EnforcerControlImpl::EnforcerControlImpl(std::shared_ptr<runtime::EnforcementLoop> loop,
                                             ControlServiceInfo info)
        : loop_(std::move(loop)), info_(std::move(info)) {}

    grpc::Status EnforcerControlImpl::GetStatus(grpc::ServerContext * /*context*/,
                                                const v1::GetStatusRequest * /*request*/,
                                                v1::GetStatusResponse *response)
    {
      response->set_running(loop_->IsRunning());
      response->set_primary_endpoint(info_.primary_endpoint);
      response->set_fallback_configured(info_.fallback_configured);
      response->set_timezone(info_.timezone);
      response->set_api_version(kApiVersion);

      if (auto last = loop_->LastReport(); last.has_value())
      {
        response->set_has_last_tick(true);
        FillReport(*last, response->mutable_last_tick());
      }

      const auto counters = loop_->Counters();
      auto *c = response->mutable_counters();
      c->set_ticks(counters.ticks);
      c->set_applied(counters.applied);
      c->set_no_change(counters.no_change);
      c->set_resolution_failures(counters.resolution_failures);
      c->set_channel_failures(counters.channel_failures);
      c->set_deadline_failures(counters.deadline_failures);
      c->set_fallback_ticks(counters.fallback_ticks);
      return grpc::Status::OK;
    }

    grpc::Status EnforcerControlImpl::TriggerEnforcement(
        grpc::ServerContext * /*context*/, const v1::TriggerEnforcementRequest * /*request*/,
        v1::TriggerEnforcementResponse *response)
    {
      const bool accepted = loop_->IsRunning();
      if (accepted)
      {
        loop_->RequestImmediateTick();
        Logger::Info("[EnforcerControl] Immediate tick requested");
      }
      response->set_accepted(accepted);
      return grpc::Status::OK;
    }

    grpc::Status EnforcerControlImpl::PreviewSelection(grpc::ServerContext * /*context*/,
                                                       const v1::PreviewSelectionRequest *request,
                                                       v1::PreviewSelectionResponse *response)
    {
      if (request->at_utc_ms() < 0)
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "at_utc_ms must not be negative");
      }
      try
      {
        const auto selection = request->at_utc_ms() == 0
                                   ? loop_->Preview(loop_->NowUtcMs())
                                   : loop_->Preview(request->at_utc_ms());
        response->set_resolved(true);
        FillSelection(selection, response->mutable_selection());
      }
      catch (const schedule::ScheduleResolutionError &e)
      {
        response->set_resolved(false);
        response->set_error(e.what());
      }
      return grpc::Status::OK;
    }

    ControlServer::ControlServer(std::string listen_address,
                                 std::shared_ptr<EnforcerControlImpl> service)
        : listen_address_(std::move(listen_address)), service_(std::move(service)) {}

    ControlServer::~ControlServer() { Shutdown(); }

    bool ControlServer::Start()
    {
      grpc::ServerBuilder builder;
      builder.AddListeningPort(listen_address_, grpc::InsecureServerCredentials(), &bound_port_);
      builder.RegisterService(service_.get());
      server_ = builder.BuildAndStart();
      if (!server_ || bound_port_ == 0)
      {
        Logger::Error("[ControlServer] Failed to listen on " + listen_address_);
        server_.reset();
        return false;
      }
      Logger::Info("[ControlServer] EnforcerControl listening on " + listen_address_ +
                   " (port " + std::to_string(bound_port_) + ")");
      return true;
    }

    void ControlServer::Shutdown()
    {
      if (!server_)
        return;
      server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
      server_.reset();
      Logger::Info("[ControlServer] Stopped");
    }

  } // namespace control
} // namespace mapcycle
