#include "connectionstate.hpp"

namespace TailControl {

const QMetaObject& connectionStateMetaObject()
{
    return staticMetaObject;
}

} // namespace TailControl
