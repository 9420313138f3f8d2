#ifndef X
#  include "models/values.h++"
#  define XBEGIN(name) namespace Pushbullet { struct name {
#  define X(field, type) type field;
#  define XEND }; }
#endif

#define Option std::optional

// The sender and receiver of an existing push arrive as flat, individually
// optional keys on the push object itself; these records hold them until
// they are reconstructed into PushSender/PushReceiver.

XBEGIN(SenderFields)
X(client_iden, Option<ClientId>)
X(channel_iden, Option<ChannelId>)
X(sender_email, Option<EmailAddress>)
X(sender_email_normalized, Option<EmailAddress>)
X(sender_iden, Option<UserId>)
X(sender_name, Option<Name>)
XEND

XBEGIN(ReceiverFields)
X(receiver_iden, Option<UserId>)
X(receiver_email, Option<EmailAddress>)
X(receiver_email_normalized, Option<EmailAddress>)
XEND

#undef Option
#undef XBEGIN
#undef X
#undef XEND
