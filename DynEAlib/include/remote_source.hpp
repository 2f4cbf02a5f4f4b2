//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains a source whose updates are pushed by another process over gRPC.

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>

#include <cereal/archives/binary.hpp>
#include <cereal/types/vector.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include <grpcpp/server_context.h>

// Generated from proto/dynealib.proto
#include "dynealib.grpc.pb.h"
#include "dynealib.pb.h"
#pragma GCC diagnostic pop

#include "observer.hpp"
#include "utilities.hpp"

class remote_update_error : public std::exception
{
    std::string message;

  public:
    remote_update_error(const std::string &message) : message("pushing update failed: " + message)
    {
    }

    const char *what() const throw()
    {
        return message.c_str();
    }
};

/**
 * @brief A source of updates that are pushed remotely, using the UpdateReceiver service.
 *
 * Payloads are encoded using a cereal binary archive. Updates are delivered to the observers
 * on the gRPC handler thread, one at a time, in the order they are received. A payload that
 * cannot be decoded is rejected with INVALID_ARGUMENT.
 */
template <typename Payload> class RemoteUpdateSource final : public UpdateReceiver::Service
{
    Observable<ObservedValue<Payload>> observable;
    std::mutex mtx;
    size_t sequence = 0;

  public:
    Observable<ObservedValue<Payload>> &getObservable()
    {
        return observable;
    }

    grpc::Status PushUpdate(grpc::ServerContext * /* context */,
                            const PushUpdateRequest *req,
                            PushUpdateResponse *res) override
    {
        Payload payload;
        try
        {
            std::stringstream ss(req->cerealencoded());
            cereal::BinaryInputArchive bia(ss);
            bia(payload);
        }
        catch (std::exception &e)
        {
            std::cerr << "Rejected remote update: " << e.what() << std::endl;
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
        }

        std::lock_guard<std::mutex> lock(mtx);
        ObservedValue<Payload> observed{std::move(payload), sequence++, std::chrono::system_clock::now()};
        observable.setChanged();
        size_t failed = observable.notifyObservers(observed);

        res->set_sequence(observed.sequence);
        res->set_failed_deliveries(failed);
        return grpc::Status::OK;
    }

    std::unique_ptr<grpc::Server> start_server(const std::string &uri, int *selected_port)
    {
        grpc::ServerBuilder server_builder;
        server_builder.AddListeningPort(uri, grpc::InsecureServerCredentials(), selected_port);
        server_builder.RegisterService(this);
        auto server = server_builder.BuildAndStart();
        t_assert(server != nullptr, "Server should start listening.");
        std::cout << "Listening for updates on port " << *selected_port << "." << std::endl;
        return server;
    }
};

class RemoteUpdateClient
{
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<UpdateReceiver::Stub> stub;

  public:
    RemoteUpdateClient(const std::string &uri);

    template <typename Payload> PushUpdateResponse push(const Payload &payload)
    {
        std::ostringstream oss;
        {
            cereal::BinaryOutputArchive boa(oss);
            boa(payload);
        }
        return push_raw(oss.str());
    }

    // Push bytes as-is, for payloads encoded elsewhere.
    PushUpdateResponse push_raw(const std::string &encoded);
};
