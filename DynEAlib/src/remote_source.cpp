//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "remote_source.hpp"

RemoteUpdateClient::RemoteUpdateClient(const std::string &uri) :
    channel(grpc::CreateChannel(uri, grpc::InsecureChannelCredentials())), stub(UpdateReceiver::NewStub(channel))
{
}

PushUpdateResponse RemoteUpdateClient::push_raw(const std::string &encoded)
{
    grpc::ClientContext context;
    PushUpdateRequest req;
    PushUpdateResponse res;
    req.set_cerealencoded(encoded);
    grpc::Status status = stub->PushUpdate(&context, req, &res);
    if (!status.ok())
        throw remote_update_error(status.error_message());
    return res;
}

