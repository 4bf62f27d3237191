#ifndef PXVC_IFACES_INCLUDED_
#define PXVC_IFACES_INCLUDED_ 1

#include "msgs.hpp"

namespace pxvc {

class IDispatcher {
public:
  virtual ~IDispatcher() {}

  virtual void SendMsg(int to, const MsgViewChange&) = 0;
  virtual void SendMsg(int to, const MsgViewChangeProof&) = 0;

  // to every replica, the sender included
  virtual void Broadcast(const MsgViewChange&) = 0;
  virtual void Broadcast(const MsgViewChangeProof&) = 0;
};

class INetDispatcher {
public:
  virtual ~INetDispatcher() {}

  virtual void SendMsg(int from, int to, const MsgViewChange&) = 0;
  virtual void SendMsg(int from, int to, const MsgViewChangeProof&) = 0;
};

// Receives the engine's upward reports
class IViewObserver {
public:
  virtual ~IViewObserver() {};

  // a quorum of ViewChanges completed view's certificate; installation follows
  virtual void QuorumCollected(int view) = 0;
  virtual void ViewInstalled(int view, int leader) = 0;
};

}

#endif
